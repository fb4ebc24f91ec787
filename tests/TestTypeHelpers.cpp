#include "TestTypeHelpers.hpp"

#include "mo/registry/CoreTypeProvider.hpp"
#include "mo/registry/RegistryBootstrap.hpp"

namespace mo::test {

std::unique_ptr<registry::TypeRegistry> CreateStandardRegistry(bool seal, const utils::CacheConfig& cache) {
    auto result = std::make_unique<registry::TypeRegistry>(cache);
    registry::RegistryBootstrap bootstrap;
    registry::AddStandardProviders(bootstrap);

    registry::RegistryBootstrap::Options options;
    options.sealAfterRegistration = seal;
    (void)bootstrap.Run(*result, options);
    return result;
}

void RegisterMinimalCatalog(registry::TypeRegistry& target) {
    using registry::TypeDefinitionBuilder;
    target.RegisterTypes({
        TypeDefinitionBuilder("attr", "base").Build(),
        TypeDefinitionBuilder("attr", "string").InheritsFrom("attr", "base").Build(),
        TypeDefinitionBuilder("attr", "boolean").InheritsFrom("attr", "base").Build(),
        TypeDefinitionBuilder("field", "base").AnyChild("attr").Build(),
        TypeDefinitionBuilder("field", "string").InheritsFrom("field", "base").Build(),
        TypeDefinitionBuilder("object", "pojo").AnyChild("field").AnyChild("attr").Build(),
    }, "minimal");
}

MetadataFixture::MetadataFixture(utils::ValidationConfig validation, bool seal)
    : registry(CreateStandardRegistry(seal)),
      engine(std::make_unique<constraint::ConstraintEngine>(*registry, validation)) {}

std::unique_ptr<metadata::MetaDataNode> MetadataFixture::Node(const std::string& type,
                                                              const std::string& subType,
                                                              const std::string& name) const {
    return metadata::MetaDataNode::Create(*engine, type, subType, name);
}

std::unique_ptr<metadata::MetaDataNode> MetadataFixture::UserObject() const {
    auto user = Node("object", "pojo", "acme::User");
    auto& email = user->AddChild(Node("field", "string", "email"));
    email.SetAttribute("required", true);
    user->AddChild(Node("field", "int", "age"));
    return user;
}

} // namespace mo::test
