#include "mo/registry/RegistryBootstrap.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "mo/core/Error.hpp"
#include "mo/core/Logger.hpp"
#include "mo/registry/TypeRegistry.hpp"

namespace mo::registry {

namespace {

constexpr const char* kBootstrapId = "registry-bootstrap";

std::string Join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += item;
    }
    return joined;
}

} // namespace

RegistryBootstrap& RegistryBootstrap::AddProvider(std::unique_ptr<TypeProvider> provider) {
    if (!provider) {
        throw core::ProviderError("<null>", "provider must not be null");
    }
    const std::string id = provider->Id();
    if (id.empty()) {
        throw core::ProviderError("<unnamed>", "provider id must not be empty");
    }
    for (const auto& existing : m_providers) {
        if (existing->Id() == id) {
            throw core::ProviderError(id, "a provider with this id was already added");
        }
    }
    m_providers.push_back(std::move(provider));
    return *this;
}

RegistryBootstrap& RegistryBootstrap::AddProvider(std::string id,
                                                  std::vector<std::string> dependencies,
                                                  CallbackTypeProvider::Callback callback,
                                                  int priority) {
    return AddProvider(std::make_unique<CallbackTypeProvider>(std::move(id), std::move(dependencies),
                                                              std::move(callback), priority));
}

std::vector<std::string> RegistryBootstrap::ResolveOrder() const {
    std::map<std::string, const TypeProvider*> byId;
    for (const auto& provider : m_providers) {
        byId.emplace(provider->Id(), provider.get());
    }

    std::map<std::string, std::size_t> pending;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& [id, provider] : byId) {
        std::set<std::string> dependencies;
        for (const auto& dependency : provider->Dependencies()) {
            if (!byId.contains(dependency)) {
                throw core::ProviderError(id, fmt::format("depends on unknown provider '{}'", dependency));
            }
            if (dependency == id) {
                throw core::ProviderError(id, "depends on itself");
            }
            dependencies.insert(dependency);
        }
        pending[id] = dependencies.size();
        for (const auto& dependency : dependencies) {
            dependents[dependency].push_back(id);
        }
    }

    // Ready providers ordered by priority (higher first), then id.
    auto readyOrder = [&byId](const std::string& a, const std::string& b) {
        const int pa = byId.at(a)->Priority();
        const int pb = byId.at(b)->Priority();
        if (pa != pb) {
            return pa > pb;
        }
        return a < b;
    };
    std::set<std::string, decltype(readyOrder)> ready(readyOrder);
    for (const auto& [id, count] : pending) {
        if (count == 0) {
            ready.insert(id);
        }
    }

    std::vector<std::string> order;
    order.reserve(byId.size());
    while (!ready.empty()) {
        const std::string next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (const auto& dependent : dependents[next]) {
            if (--pending[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != byId.size()) {
        std::vector<std::string> blocked;
        for (const auto& [id, count] : pending) {
            if (count > 0) {
                blocked.push_back(id);
            }
        }
        throw core::ProviderError(kBootstrapId, fmt::format("dependency cycle among providers: {}", Join(blocked)));
    }
    return order;
}

BootstrapResult RegistryBootstrap::Run(TypeRegistry& registry, const Options& options) const {
    BootstrapResult result;
    result.providerOrder = ResolveOrder();

    core::Logger::Info("[RegistryBootstrap] Running {} provider(s): {}",
                       result.providerOrder.size(), Join(result.providerOrder));

    const std::size_t typesBefore = registry.GetAllTypeDefinitions().size();

    for (const auto& id : result.providerOrder) {
        auto it = std::find_if(m_providers.begin(), m_providers.end(),
                               [&id](const auto& provider) { return provider->Id() == id; });
        TypeProvider& provider = **it;

        const std::size_t before = registry.GetAllTypeDefinitions().size();
        try {
            provider.RegisterTypes(registry);
        } catch (const core::Error& e) {
            core::Logger::Error("[RegistryBootstrap] Provider '{}' failed: {}", id, e.what());
            throw;
        } catch (const std::exception& e) {
            core::Logger::Error("[RegistryBootstrap] Provider '{}' failed: {}", id, e.what());
            throw core::ProviderError(id, e.what());
        }
        core::Logger::Debug("[RegistryBootstrap] Provider '{}' registered {} type(s)",
                            id, registry.GetAllTypeDefinitions().size() - before);
    }

    result.typesRegistered = registry.GetAllTypeDefinitions().size() - typesBefore;
    result.health = registry.ValidateConsistency();
    if (options.requireHealthyCatalog && !result.health.IsHealthy()) {
        for (const auto& error : result.health.errors) {
            core::Logger::Error("[RegistryBootstrap] {}", error);
        }
        throw core::ProviderError(kBootstrapId, result.health.Summary());
    }

    if (options.sealAfterRegistration) {
        registry.Seal();
    }

    core::Logger::Info("[RegistryBootstrap] Registered {} type(s){}", result.typesRegistered,
                       options.sealAfterRegistration ? ", registry sealed" : "");
    return result;
}

} // namespace mo::registry
