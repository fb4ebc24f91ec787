#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace mo::registry {

class TypeRegistry;

/**
 * @brief A unit of type registration run by RegistryBootstrap.
 *
 * Providers declare the ids of the providers they depend on; the bootstrap runs
 * dependencies first. Among providers whose dependencies are satisfied, higher
 * Priority() runs first.
 */
class TypeProvider {
public:
    virtual ~TypeProvider() = default;

    virtual std::string Id() const = 0;
    virtual std::vector<std::string> Dependencies() const { return {}; }
    virtual int Priority() const { return 0; }
    virtual std::string Description() const { return {}; }

    virtual void RegisterTypes(TypeRegistry& registry) = 0;
};

class CallbackTypeProvider : public TypeProvider {
public:
    using Callback = std::function<void(TypeRegistry&)>;

    CallbackTypeProvider(std::string id, std::vector<std::string> dependencies, Callback callback, int priority = 0)
        : m_id(std::move(id)),
          m_dependencies(std::move(dependencies)),
          m_callback(std::move(callback)),
          m_priority(priority) {}

    std::string Id() const override { return m_id; }
    std::vector<std::string> Dependencies() const override { return m_dependencies; }
    int Priority() const override { return m_priority; }

    void RegisterTypes(TypeRegistry& registry) override {
        if (m_callback) {
            m_callback(registry);
        }
    }

private:
    std::string m_id;
    std::vector<std::string> m_dependencies;
    Callback m_callback;
    int m_priority = 0;
};

} // namespace mo::registry
