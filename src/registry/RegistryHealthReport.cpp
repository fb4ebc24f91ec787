#include "mo/registry/RegistryHealthReport.hpp"

#include <map>
#include <set>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "mo/registry/TypeDefinition.hpp"

namespace mo::registry {

namespace {

// Category bases may inherit from the shared root type without a warning.
constexpr const char* kRootCategory = "metadata";

} // namespace

std::string RegistryHealthReport::Summary() const {
    return fmt::format("Registry health: {} type(s) in {} categor{}, {} error(s), {} warning(s)",
                       typeCount, categoryCount, categoryCount == 1 ? "y" : "ies",
                       errors.size(), warnings.size());
}

nlohmann::json RegistryHealthReport::ToJson() const {
    return {
        {"healthy", IsHealthy()},
        {"typeCount", typeCount},
        {"categoryCount", categoryCount},
        {"errors", errors},
        {"warnings", warnings}
    };
}

RegistryHealthReport RegistryHealthReport::Analyze(
    const std::vector<std::shared_ptr<const TypeDefinition>>& definitions) {
    RegistryHealthReport report;
    report.typeCount = definitions.size();

    std::set<TypeId> registered;
    std::map<std::string, std::set<std::string>> subTypesByCategory;
    for (const auto& definition : definitions) {
        registered.insert(definition->Id());
        subTypesByCategory[definition->Type()].insert(definition->SubType());
    }
    report.categoryCount = subTypesByCategory.size();

    for (const auto& [category, subTypes] : subTypesByCategory) {
        if (subTypes.size() > 1 && !subTypes.contains(std::string(kBaseSubType))) {
            report.warnings.push_back(
                fmt::format("Category '{}' has {} subtypes but no '{}' subtype", category, subTypes.size(), kBaseSubType));
        }
    }

    const bool attributesRegistered = subTypesByCategory.contains("attr");

    for (const auto& definition : definitions) {
        const std::string qualifiedName = definition->QualifiedName();

        if (definition->HasParent()) {
            const TypeId& parent = *definition->Parent();
            if (!registered.contains(parent)) {
                report.errors.push_back(
                    fmt::format("{} inherits from missing type {}", qualifiedName, parent.QualifiedName()));
            } else if (parent.type != definition->Type() && parent.type != kRootCategory) {
                report.warnings.push_back(fmt::format("{} inherits across categories from {}",
                                                      qualifiedName, parent.QualifiedName()));
            }
        }

        for (const auto& requirement : definition->ChildRequirements()) {
            const auto& expected = requirement.Expected();
            if (!IsWildcard(expected.type) && !subTypesByCategory.contains(expected.type)) {
                report.warnings.push_back(fmt::format("{} declares child '{}' of unregistered category '{}'",
                                                      qualifiedName, requirement.Name(), expected.type));
            } else if (!IsWildcard(expected.type) && !IsWildcard(expected.subType) &&
                       !registered.contains(expected)) {
                report.warnings.push_back(fmt::format("{} declares child '{}' of unregistered type {}",
                                                      qualifiedName, requirement.Name(), expected.QualifiedName()));
            }
        }

        if (!attributesRegistered) {
            continue;
        }
        for (const auto& [name, attributeConstraint] : definition->Constraints()) {
            const TypeId attrType("attr", attributeConstraint.AttributeSubType());
            if (!registered.contains(attrType)) {
                report.errors.push_back(fmt::format("{} constrains attribute '{}' as {} but {} is not registered",
                                                    qualifiedName, name, attributeConstraint.AttributeSubType(),
                                                    attrType.QualifiedName()));
            }
        }
    }

    if (!attributesRegistered && !definitions.empty()) {
        report.warnings.emplace_back("No attribute types ('attr' category) are registered");
    }

    return report;
}

} // namespace mo::registry
