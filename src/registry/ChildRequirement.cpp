#include "mo/registry/ChildRequirement.hpp"

#include <utility>

#include <fmt/format.h>

namespace mo::registry {

ChildRequirement::ChildRequirement(std::string name,
                                   std::string_view expectedType,
                                   std::string_view expectedSubType,
                                   bool required,
                                   std::string description)
    : m_name(std::move(name)),
      m_expected(expectedType, expectedSubType),
      m_required(required),
      m_description(std::move(description)) {
    if (m_name.empty()) {
        m_name = std::string(kWildcard);
    }
}

ChildRequirement ChildRequirement::Optional(std::string name, std::string_view type, std::string_view subType) {
    return ChildRequirement(std::move(name), type, subType, false);
}

ChildRequirement ChildRequirement::Required(std::string name, std::string_view type, std::string_view subType) {
    return ChildRequirement(std::move(name), type, subType, true);
}

std::string ChildRequirement::Key() const {
    if (HasWildcardName()) {
        return fmt::format("*:{}:{}", m_expected.type, m_expected.subType);
    }
    return m_name;
}

bool ChildRequirement::MatchesType(std::string_view childType) const {
    return IsWildcard(m_expected.type) || m_expected.type == NormalizeTypeName(childType);
}

bool ChildRequirement::Matches(std::string_view childType,
                               std::string_view childSubType,
                               std::string_view childName) const {
    if (!IsWildcard(m_name) && m_name != childName) {
        return false;
    }
    if (!MatchesType(childType)) {
        return false;
    }
    return IsWildcard(m_expected.subType) || m_expected.subType == NormalizeTypeName(childSubType);
}

std::string ChildRequirement::Describe() const {
    const char* requiredness = m_required ? "required" : "optional";
    const std::string type = IsWildcard(m_expected.type) ? std::string("child") : m_expected.type;
    const std::string name = IsWildcard(m_name) ? std::string() : fmt::format(" '{}'", m_name);
    const std::string subType = IsWildcard(m_expected.subType)
                                    ? std::string(" of any type")
                                    : fmt::format(" of type {}", m_expected.subType);
    return fmt::format("{} {}{}{}", requiredness, type, name, subType);
}

} // namespace mo::registry
