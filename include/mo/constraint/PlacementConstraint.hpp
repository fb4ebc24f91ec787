#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "mo/registry/ChildRequirement.hpp"
#include "mo/registry/TypeId.hpp"

namespace mo::constraint {

/**
 * @brief A ChildRequirement bound to the type that declared it.
 *
 * The declaring type is kept so placement errors can say where a rule came from
 * after inheritance merged it into a descendant.
 */
class PlacementConstraint {
public:
    PlacementConstraint(registry::TypeId declaringType, registry::ChildRequirement requirement)
        : m_declaringType(std::move(declaringType)),
          m_requirement(std::move(requirement)) {}

    [[nodiscard]] const registry::TypeId& DeclaringType() const { return m_declaringType; }
    [[nodiscard]] const registry::ChildRequirement& Requirement() const { return m_requirement; }
    [[nodiscard]] std::string Key() const { return m_requirement.Key(); }
    [[nodiscard]] bool IsLiteral() const { return !m_requirement.HasWildcardName(); }

    [[nodiscard]] bool Permits(std::string_view childType,
                               std::string_view childSubType,
                               std::string_view childName) const {
        return m_requirement.Matches(childType, childSubType, childName);
    }

    [[nodiscard]] std::string Describe() const { return m_requirement.Describe(); }

    bool operator==(const PlacementConstraint&) const = default;

private:
    registry::TypeId m_declaringType;
    registry::ChildRequirement m_requirement;
};

} // namespace mo::constraint
