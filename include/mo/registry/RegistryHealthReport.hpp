#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace mo::registry {

class TypeDefinition;

/**
 * @brief Result of TypeRegistry::ValidateConsistency.
 *
 * Errors make the catalog unusable for loading; warnings flag suspicious but
 * legal declarations.
 */
struct RegistryHealthReport {
    std::size_t typeCount = 0;
    std::size_t categoryCount = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool IsHealthy() const { return errors.empty(); }
    [[nodiscard]] std::string Summary() const;
    [[nodiscard]] nlohmann::json ToJson() const;

    static RegistryHealthReport Analyze(const std::vector<std::shared_ptr<const TypeDefinition>>& definitions);
};

} // namespace mo::registry
