#pragma once

#include <string>
#include <string_view>

#include "mo/registry/TypeId.hpp"

namespace mo::registry {

/**
 * @brief One permitted child shape of a type.
 *
 * The name is a literal child name or "*". Expected type and subtype are
 * literal or "*", and are normalised to lower case. A required requirement
 * with a literal name must be satisfied before loading completes.
 */
class ChildRequirement {
public:
    ChildRequirement(std::string name,
                     std::string_view expectedType,
                     std::string_view expectedSubType,
                     bool required = false,
                     std::string description = {});

    static ChildRequirement Optional(std::string name, std::string_view type, std::string_view subType);
    static ChildRequirement Required(std::string name, std::string_view type, std::string_view subType);

    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] const std::string& ExpectedType() const { return m_expected.type; }
    [[nodiscard]] const std::string& ExpectedSubType() const { return m_expected.subType; }
    [[nodiscard]] const TypeId& Expected() const { return m_expected; }
    [[nodiscard]] bool IsRequired() const { return m_required; }
    [[nodiscard]] const std::string& Description() const { return m_description; }
    [[nodiscard]] bool HasWildcardName() const { return IsWildcard(m_name); }

    /// Inheritance key: the literal name, or "*:type:subType" for wildcard names.
    [[nodiscard]] std::string Key() const;

    [[nodiscard]] bool Matches(std::string_view childType,
                               std::string_view childSubType,
                               std::string_view childName) const;
    [[nodiscard]] bool MatchesType(std::string_view childType) const;

    /// "required field 'email' of type string", "optional attribute of any type", ...
    [[nodiscard]] std::string Describe() const;

    bool operator==(const ChildRequirement&) const = default;

private:
    std::string m_name;
    TypeId m_expected;
    bool m_required = false;
    std::string m_description;
};

} // namespace mo::registry
