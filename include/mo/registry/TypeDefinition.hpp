#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mo/constraint/ValidationConstraint.hpp"
#include "mo/registry/ChildRequirement.hpp"
#include "mo/registry/TypeId.hpp"

namespace mo::registry {

class TypeDefinitionBuilder;

/**
 * @brief The registered contract for one (type, subType) pair.
 *
 * Immutable once built; shared as std::shared_ptr<const TypeDefinition>.
 * Holds only the type's own declarations. Inherited views are merged by the
 * TypeRegistry.
 */
class TypeDefinition {
public:
    using ConstraintMap = std::map<std::string, constraint::ValidationConstraint>;

    [[nodiscard]] const TypeId& Id() const { return m_id; }
    [[nodiscard]] const std::string& Type() const { return m_id.type; }
    [[nodiscard]] const std::string& SubType() const { return m_id.subType; }
    [[nodiscard]] std::string QualifiedName() const { return m_id.QualifiedName(); }

    [[nodiscard]] bool HasParent() const { return m_parent.has_value(); }
    [[nodiscard]] const std::optional<TypeId>& Parent() const { return m_parent; }

    [[nodiscard]] const std::vector<ChildRequirement>& ChildRequirements() const { return m_childRequirements; }
    [[nodiscard]] const ConstraintMap& Constraints() const { return m_constraints; }
    [[nodiscard]] const ChildRequirement* FindChildRequirement(std::string_view key) const;
    [[nodiscard]] const constraint::ValidationConstraint* FindConstraint(std::string_view attributeName) const;

    [[nodiscard]] const std::string& Description() const { return m_description; }
    [[nodiscard]] const std::string& Implementation() const { return m_implementation; }
    [[nodiscard]] const std::string& ProviderId() const { return m_providerId; }

    /// Copy of this definition attributed to another provider.
    [[nodiscard]] std::shared_ptr<const TypeDefinition> WithProviderId(std::string providerId) const;

    /// Equal declarations, ignoring which provider registered them.
    [[nodiscard]] bool SameContract(const TypeDefinition& other) const;

    [[nodiscard]] std::string ToString() const;

private:
    friend class TypeDefinitionBuilder;
    TypeDefinition() = default;

    TypeId m_id;
    std::optional<TypeId> m_parent;
    std::vector<ChildRequirement> m_childRequirements;
    ConstraintMap m_constraints;
    std::string m_description;
    std::string m_implementation;
    std::string m_providerId;
};

/**
 * @brief Fluent builder for TypeDefinition.
 *
 * Attribute() takes a built ValidationConstraint and also declares the matching
 * attribute child, so a constrained attribute is always a legal child.
 */
class TypeDefinitionBuilder {
public:
    TypeDefinitionBuilder(std::string_view type, std::string_view subType);

    TypeDefinitionBuilder& InheritsFrom(std::string_view parentType, std::string_view parentSubType);
    TypeDefinitionBuilder& Describe(std::string description);
    TypeDefinitionBuilder& Implementation(std::string implementation);
    TypeDefinitionBuilder& ProvidedBy(std::string providerId);

    TypeDefinitionBuilder& Child(ChildRequirement requirement);
    TypeDefinitionBuilder& OptionalChild(std::string name, std::string_view type, std::string_view subType);
    TypeDefinitionBuilder& RequiredChild(std::string name, std::string_view type, std::string_view subType);
    TypeDefinitionBuilder& AnyChild(std::string_view type, std::string_view subType = kWildcard);

    TypeDefinitionBuilder& Attribute(constraint::ValidationConstraint attributeConstraint);

    /// Throws RegistrationError (or CircularReferenceError for self-inheritance).
    [[nodiscard]] std::shared_ptr<const TypeDefinition> Build() const;

private:
    TypeId m_id;
    std::optional<TypeId> m_parent;
    std::vector<ChildRequirement> m_childRequirements;
    std::vector<constraint::ValidationConstraint> m_constraints;
    std::string m_description;
    std::string m_implementation;
    std::string m_providerId;
};

} // namespace mo::registry
