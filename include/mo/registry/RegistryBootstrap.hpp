#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "mo/registry/RegistryHealthReport.hpp"
#include "mo/registry/TypeProvider.hpp"

namespace mo::registry {

class TypeRegistry;

struct BootstrapResult {
    std::vector<std::string> providerOrder;
    std::size_t typesRegistered = 0;
    RegistryHealthReport health;
};

/**
 * @brief Runs type providers against a registry in dependency order.
 *
 * Order is a topological sort over declared dependency ids with priority as
 * tie-break (higher first, then id). A missing dependency or a dependency cycle
 * fails before any provider runs. A provider failure is logged and aborts the
 * bootstrap; the registry is left unsealed.
 */
class RegistryBootstrap {
public:
    struct Options {
        bool sealAfterRegistration = true;
        bool requireHealthyCatalog = true;
    };

    RegistryBootstrap& AddProvider(std::unique_ptr<TypeProvider> provider);
    RegistryBootstrap& AddProvider(std::string id,
                                   std::vector<std::string> dependencies,
                                   CallbackTypeProvider::Callback callback,
                                   int priority = 0);

    [[nodiscard]] std::size_t ProviderCount() const { return m_providers.size(); }

    /// Throws ProviderError on a missing dependency or a cycle.
    [[nodiscard]] std::vector<std::string> ResolveOrder() const;

    BootstrapResult Run(TypeRegistry& registry) const { return Run(registry, Options{}); }
    BootstrapResult Run(TypeRegistry& registry, const Options& options) const;

private:
    std::vector<std::unique_ptr<TypeProvider>> m_providers;
};

} // namespace mo::registry
