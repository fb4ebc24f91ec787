#include "mo/registry/TypeDefinition.hpp"

#include <set>
#include <utility>

#include <fmt/format.h>

#include "mo/core/Error.hpp"

namespace mo::registry {

const ChildRequirement* TypeDefinition::FindChildRequirement(std::string_view key) const {
    for (const auto& requirement : m_childRequirements) {
        if (requirement.Key() == key) {
            return &requirement;
        }
    }
    return nullptr;
}

const constraint::ValidationConstraint* TypeDefinition::FindConstraint(std::string_view attributeName) const {
    auto it = m_constraints.find(std::string(attributeName));
    return it != m_constraints.end() ? &it->second : nullptr;
}

std::shared_ptr<const TypeDefinition> TypeDefinition::WithProviderId(std::string providerId) const {
    auto copy = std::shared_ptr<TypeDefinition>(new TypeDefinition(*this));
    copy->m_providerId = std::move(providerId);
    return copy;
}

bool TypeDefinition::SameContract(const TypeDefinition& other) const {
    return m_id == other.m_id &&
           m_parent == other.m_parent &&
           m_childRequirements == other.m_childRequirements &&
           m_constraints == other.m_constraints &&
           m_description == other.m_description &&
           m_implementation == other.m_implementation;
}

std::string TypeDefinition::ToString() const {
    std::string text = fmt::format("TypeDefinition[{}", QualifiedName());
    if (m_parent) {
        text += fmt::format(" extends {}", m_parent->QualifiedName());
    }
    text += fmt::format(", {} child requirement(s), {} constraint(s)", m_childRequirements.size(),
                        m_constraints.size());
    if (!m_providerId.empty()) {
        text += fmt::format(", provider {}", m_providerId);
    }
    text += "]";
    return text;
}

TypeDefinitionBuilder::TypeDefinitionBuilder(std::string_view type, std::string_view subType)
    : m_id(type, subType) {}

TypeDefinitionBuilder& TypeDefinitionBuilder::InheritsFrom(std::string_view parentType,
                                                           std::string_view parentSubType) {
    m_parent = TypeId(parentType, parentSubType);
    return *this;
}

TypeDefinitionBuilder& TypeDefinitionBuilder::Describe(std::string description) {
    m_description = std::move(description);
    return *this;
}

TypeDefinitionBuilder& TypeDefinitionBuilder::Implementation(std::string implementation) {
    m_implementation = std::move(implementation);
    return *this;
}

TypeDefinitionBuilder& TypeDefinitionBuilder::ProvidedBy(std::string providerId) {
    m_providerId = std::move(providerId);
    return *this;
}

TypeDefinitionBuilder& TypeDefinitionBuilder::Child(ChildRequirement requirement) {
    m_childRequirements.push_back(std::move(requirement));
    return *this;
}

TypeDefinitionBuilder& TypeDefinitionBuilder::OptionalChild(std::string name,
                                                            std::string_view type,
                                                            std::string_view subType) {
    return Child(ChildRequirement::Optional(std::move(name), type, subType));
}

TypeDefinitionBuilder& TypeDefinitionBuilder::RequiredChild(std::string name,
                                                            std::string_view type,
                                                            std::string_view subType) {
    return Child(ChildRequirement::Required(std::move(name), type, subType));
}

TypeDefinitionBuilder& TypeDefinitionBuilder::AnyChild(std::string_view type, std::string_view subType) {
    return Child(ChildRequirement::Optional(std::string(kWildcard), type, subType));
}

TypeDefinitionBuilder& TypeDefinitionBuilder::Attribute(constraint::ValidationConstraint attributeConstraint) {
    m_childRequirements.emplace_back(attributeConstraint.AttributeName(),
                                     "attr",
                                     attributeConstraint.AttributeSubType(),
                                     attributeConstraint.IsRequired(),
                                     attributeConstraint.Description());
    m_constraints.push_back(std::move(attributeConstraint));
    return *this;
}

std::shared_ptr<const TypeDefinition> TypeDefinitionBuilder::Build() const {
    const std::string qualifiedName = m_id.QualifiedName();
    if (m_id.type.empty() || m_id.subType.empty()) {
        throw core::RegistrationError(qualifiedName, "type and subType must not be empty");
    }
    if (m_id.HasWildcard()) {
        throw core::RegistrationError(qualifiedName, "a registered type cannot use the wildcard");
    }
    if (m_parent) {
        if (m_parent->type.empty() || m_parent->subType.empty() || m_parent->HasWildcard()) {
            throw core::RegistrationError(qualifiedName,
                                          fmt::format("invalid parent '{}'", m_parent->QualifiedName()));
        }
        if (*m_parent == m_id) {
            throw core::CircularReferenceError({qualifiedName, qualifiedName});
        }
    }

    auto definition = std::shared_ptr<TypeDefinition>(new TypeDefinition());
    definition->m_id = m_id;
    definition->m_parent = m_parent;
    definition->m_description = m_description;
    definition->m_implementation = m_implementation;
    definition->m_providerId = m_providerId;

    std::set<std::string> keys;
    for (const auto& requirement : m_childRequirements) {
        if (!keys.insert(requirement.Key()).second) {
            throw core::RegistrationError(qualifiedName,
                                          fmt::format("child requirement '{}' declared twice", requirement.Key()));
        }
        definition->m_childRequirements.push_back(requirement);
    }

    for (const auto& attributeConstraint : m_constraints) {
        auto [it, inserted] = definition->m_constraints.emplace(attributeConstraint.AttributeName(), attributeConstraint);
        if (!inserted) {
            throw core::MalformedConstraintError(attributeConstraint.AttributeName(),
                                                 fmt::format("declared twice on {}", qualifiedName));
        }
    }

    return definition;
}

} // namespace mo::registry
