#include "mo/constraint/ConstraintEngine.hpp"

#include <fmt/format.h>

#include "mo/core/Error.hpp"
#include "mo/core/Logger.hpp"
#include "mo/metadata/MetaDataNode.hpp"
#include "mo/registry/TypeRegistry.hpp"

namespace mo::constraint {

namespace {

std::string DescribeShape(const metadata::MetaDataNode& node) {
    return fmt::format("{}:{}({})", node.Type(), node.SubType(), node.Name());
}

} // namespace

ConstraintEngine::ConstraintEngine(const registry::TypeRegistry& registry, utils::ValidationConfig config)
    : m_registry(&registry),
      m_config(config) {}

void ConstraintEngine::ValidatePlacement(const metadata::MetaDataNode& parent,
                                         const metadata::MetaDataNode& child) const {
    if (!m_config.enforcePlacement) {
        return;
    }
    if (!m_registry->IsRegistered(parent.Type(), parent.SubType())) {
        throw core::NotFoundError("Type", fmt::format("{}.{}", parent.Type(), parent.SubType()), parent.Path());
    }
    if (m_registry->MatchPlacement(parent.Type(), parent.SubType(), child.Type(), child.SubType(), child.Name())) {
        return;
    }

    std::vector<std::string> legalShapes;
    const auto requirements = m_registry->GetInheritedChildRequirements(parent.Type(), parent.SubType());
    legalShapes.reserve(requirements->size());
    for (const auto& [key, placement] : *requirements) {
        legalShapes.push_back(placement.Describe());
    }
    throw core::PlacementViolationError(parent.Path(), DescribeShape(child), std::move(legalShapes));
}

bool ConstraintEngine::AcceptsPlacement(const metadata::MetaDataNode& parent,
                                        const metadata::MetaDataNode& child) const {
    if (!m_config.enforcePlacement) {
        return true;
    }
    return m_registry->AcceptsChild(parent.Type(), parent.SubType(), child.Type(), child.SubType(), child.Name());
}

std::optional<ValidationConstraint> ConstraintEngine::FindAttributeConstraint(const metadata::MetaDataNode& node,
                                                                              std::string_view attributeName) const {
    if (!m_registry->IsRegistered(node.Type(), node.SubType())) {
        return std::nullopt;
    }
    const auto constraints = m_registry->GetInheritedConstraints(node.Type(), node.SubType());
    auto it = constraints->find(std::string(attributeName));
    if (it == constraints->end()) {
        return std::nullopt;
    }
    return it->second;
}

void ConstraintEngine::ValidateAttributeValue(const metadata::MetaDataNode& node,
                                              std::string_view attributeName,
                                              const nlohmann::json& value) const {
    if (auto attributeConstraint = FindAttributeConstraint(node, attributeName)) {
        attributeConstraint->Validate(node.Path(), value);
        return;
    }
    if (!InferAttributeSubType(value)) {
        throw core::ValueConstraintViolationError(node.Path(), std::string(attributeName), "kind", value.dump(),
                                                  "attribute values must be scalars or homogeneous arrays");
    }
}

std::string ConstraintEngine::ResolveAttributeSubType(const metadata::MetaDataNode& node,
                                                      std::string_view attributeName,
                                                      const nlohmann::json& value) const {
    if (auto attributeConstraint = FindAttributeConstraint(node, attributeName)) {
        return attributeConstraint->AttributeSubType();
    }
    if (auto inferred = InferAttributeSubType(value)) {
        return *inferred;
    }
    throw core::ValueConstraintViolationError(node.Path(), std::string(attributeName), "kind", value.dump(),
                                              "attribute values must be scalars or homogeneous arrays");
}

void ConstraintEngine::CollectMissingRequirements(const metadata::MetaDataNode& root,
                                                  std::vector<std::string>& missing) const {
    if (m_registry->IsRegistered(root.Type(), root.SubType())) {
        const auto requirements = m_registry->GetInheritedChildRequirements(root.Type(), root.SubType());
        for (const auto& [key, placement] : *requirements) {
            const auto& requirement = placement.Requirement();
            if (!requirement.IsRequired() || requirement.HasWildcardName()) {
                continue;
            }
            const std::string_view type = registry::IsWildcard(requirement.ExpectedType())
                                              ? std::string_view{}
                                              : std::string_view{requirement.ExpectedType()};
            const auto* present = root.FindChild(requirement.Name(), type, true);
            if (!present || !placement.Permits(present->Type(), present->SubType(), present->Name())) {
                missing.push_back(fmt::format("{}: {}", root.Path(), requirement.Describe()));
            }
        }
    }

    for (const auto* child : *root.GetChildren()) {
        CollectMissingRequirements(*child, missing);
    }
}

void ConstraintEngine::ValidateCompleteness(const metadata::MetaDataNode& root) const {
    std::vector<std::string> missing;
    CollectMissingRequirements(root, missing);
    if (missing.empty()) {
        return;
    }
    if (m_config.strictCompleteness) {
        throw core::IncompleteMetadataError(root.Path(), std::move(missing));
    }
    for (const auto& gap : missing) {
        core::Logger::Warning("[ConstraintEngine] Incomplete metadata: {}", gap);
    }
}

} // namespace mo::constraint
