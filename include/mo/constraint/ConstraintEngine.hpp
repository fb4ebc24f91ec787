#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mo/constraint/ValidationConstraint.hpp"
#include "mo/utils/Config.hpp"

namespace mo::registry {
class TypeRegistry;
}

namespace mo::metadata {
class MetaDataNode;
}

namespace mo::constraint {

/**
 * @brief Decides whether a child placement or an attribute value is legal.
 *
 * Stateless apart from its configuration; every decision reads the merged,
 * cached views of the TypeRegistry. Node mutation never triggers
 * recomputation here.
 */
class ConstraintEngine {
public:
    explicit ConstraintEngine(const registry::TypeRegistry& registry, utils::ValidationConfig config = {});

    [[nodiscard]] const registry::TypeRegistry& Registry() const { return *m_registry; }
    [[nodiscard]] const utils::ValidationConfig& Config() const { return m_config; }

    /// Throws PlacementViolationError with the legal shapes when no requirement admits the child.
    void ValidatePlacement(const metadata::MetaDataNode& parent, const metadata::MetaDataNode& child) const;
    [[nodiscard]] bool AcceptsPlacement(const metadata::MetaDataNode& parent, const metadata::MetaDataNode& child) const;

    /// Throws ValueConstraintViolationError naming the violated rule.
    void ValidateAttributeValue(const metadata::MetaDataNode& node,
                                std::string_view attributeName,
                                const nlohmann::json& value) const;

    [[nodiscard]] std::optional<ValidationConstraint> FindAttributeConstraint(const metadata::MetaDataNode& node,
                                                                              std::string_view attributeName) const;

    /// Subtype an attribute value is stored under on this node.
    [[nodiscard]] std::string ResolveAttributeSubType(const metadata::MetaDataNode& node,
                                                      std::string_view attributeName,
                                                      const nlohmann::json& value) const;

    /// Throws IncompleteMetadataError when strict, logs the gaps otherwise.
    void ValidateCompleteness(const metadata::MetaDataNode& root) const;
    void CollectMissingRequirements(const metadata::MetaDataNode& root, std::vector<std::string>& missing) const;

private:
    const registry::TypeRegistry* m_registry;
    utils::ValidationConfig m_config;
};

} // namespace mo::constraint
