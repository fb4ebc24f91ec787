#pragma once

#include <memory>
#include <string>

#include "mo/constraint/ConstraintEngine.hpp"
#include "mo/metadata/MetaDataNode.hpp"
#include "mo/registry/TypeDefinition.hpp"
#include "mo/registry/TypeRegistry.hpp"
#include "mo/utils/Config.hpp"

namespace mo::test {

/// Registry loaded with the standard core and field providers.
std::unique_ptr<registry::TypeRegistry> CreateStandardRegistry(bool seal = true,
                                                               const utils::CacheConfig& cache = {});

/// Minimal object/field/attr catalog without the standard providers.
void RegisterMinimalCatalog(registry::TypeRegistry& registry);

/// Registry, engine and a helper to build nodes against them.
struct MetadataFixture {
    explicit MetadataFixture(utils::ValidationConfig validation = {}, bool seal = true);

    std::unique_ptr<metadata::MetaDataNode> Node(const std::string& type,
                                                 const std::string& subType,
                                                 const std::string& name) const;

    /// object.pojo "User" with string field "email" (required) and int field "age".
    std::unique_ptr<metadata::MetaDataNode> UserObject() const;

    std::unique_ptr<registry::TypeRegistry> registry;
    std::unique_ptr<constraint::ConstraintEngine> engine;
};

} // namespace mo::test
