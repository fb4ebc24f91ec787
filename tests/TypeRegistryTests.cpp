#include "mo/registry/TypeRegistry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

#include <nlohmann/json.hpp>

#include "mo/core/Error.hpp"
#include "mo/registry/TypeDefinition.hpp"
#include "TestTypeHelpers.hpp"

using mo::constraint::ValidationConstraint;
using mo::registry::ChildRequirement;
using mo::registry::TypeDefinitionBuilder;
using mo::registry::TypeRegistry;

TEST_CASE("TypeRegistry registers and looks up types", "[registry]") {
    TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);

    REQUIRE(registry.IsRegistered("field", "string"));
    REQUIRE(registry.IsRegistered("FIELD", "String"));
    REQUIRE(registry.HasType("object"));
    REQUIRE_FALSE(registry.HasType("validator"));
    REQUIRE(registry.GetSubTypes("field") == std::vector<std::string>{"base", "string"});

    const auto definition = registry.GetTypeDefinition("field", "string");
    REQUIRE(definition->QualifiedName() == "field.string");
    REQUIRE(definition->ProviderId() == "minimal");
    REQUIRE(definition->Parent()->QualifiedName() == "field.base");

    const auto names = registry.GetRegisteredTypeNames();
    REQUIRE(std::is_sorted(names.begin(), names.end()));
    REQUIRE(names.size() == 6);
}

TEST_CASE("Unknown types fail only through the throwing accessor", "[registry]") {
    auto registry = mo::test::CreateStandardRegistry();

    try {
        (void)registry->GetTypeDefinition("validator", "creditCard");
        FAIL("expected NotFoundError");
    } catch (const mo::core::NotFoundError& e) {
        const std::string message = e.what();
        REQUIRE(message.find("creditCard") != std::string::npos);
        REQUIRE(message.find("validator.regex") != std::string::npos);
    }

    REQUIRE_NOTHROW(registry->FindTypeDefinition("validator", "creditCard"));
    REQUIRE(registry->FindTypeDefinition("validator", "creditCard") == nullptr);
    REQUIRE_FALSE(registry->IsRegistered("validator", "creditCard"));
}

TEST_CASE("Registering an identical definition twice is a no-op", "[registry]") {
    TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);
    const auto before = registry.GetTypeDefinition("field", "string");

    REQUIRE_NOTHROW(registry.RegisterType(
        TypeDefinitionBuilder("field", "string").InheritsFrom("field", "base").Build(), "minimal"));
    REQUIRE(registry.GetTypeDefinition("field", "string") == before);
}

TEST_CASE("Conflicting definitions from another provider are rejected", "[registry]") {
    TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);

    auto conflicting = TypeDefinitionBuilder("field", "string")
                           .InheritsFrom("field", "base")
                           .Describe("something else")
                           .Build();
    REQUIRE_THROWS_AS(registry.RegisterType(conflicting, "plugin"), mo::core::DuplicateTypeError);
}

TEST_CASE("Inherited views merge the whole chain with most-derived winning", "[registry]") {
    TypeRegistry registry;
    registry.RegisterTypes({
        TypeDefinitionBuilder("attr", "base").Build(),
        TypeDefinitionBuilder("attr", "int").InheritsFrom("attr", "base").Build(),
        TypeDefinitionBuilder("attr", "string").InheritsFrom("attr", "base").Build(),
        TypeDefinitionBuilder("field", "base")
            .OptionalChild("label", "attr", "string")
            .Attribute(ValidationConstraint::ForAttribute("size").OfInt().Single().AtLeast(0).Build())
            .Build(),
        TypeDefinitionBuilder("field", "string")
            .InheritsFrom("field", "base")
            .Attribute(ValidationConstraint::ForAttribute("size").OfInt().Single().Within(0, 255).Build())
            .Build(),
    });

    const auto requirements = registry.GetInheritedChildRequirements("field", "string");
    REQUIRE(requirements->contains("label"));
    REQUIRE(requirements->at("label").DeclaringType().QualifiedName() == "field.base");

    const auto constraints = registry.GetInheritedConstraints("field", "string");
    REQUIRE(constraints->at("size").Maximum() == 255.0);
    REQUIRE(registry.GetInheritedConstraints("field", "base")->at("size").Maximum() == std::nullopt);

    REQUIRE(registry.GetDirectChildRequirements("field", "string").size() == 1);

    const auto chain = registry.GetInheritanceChain("field", "string");
    REQUIRE(chain.size() == 2);
    REQUIRE(chain.front()->QualifiedName() == "field.base");
    REQUIRE(chain.back()->QualifiedName() == "field.string");
}

TEST_CASE("Wildcard requirements accept any matching child", "[registry]") {
    TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);

    REQUIRE(registry.AcceptsChild("object", "pojo", "field", "string", "email"));
    REQUIRE(registry.AcceptsChild("object", "pojo", "field", "anything", "whatever"));
    REQUIRE_FALSE(registry.AcceptsChild("object", "pojo", "validator", "required", "email"));
    REQUIRE_FALSE(registry.AcceptsChild("field", "unknown", "attr", "string", "x"));
    REQUIRE(registry.GetSupportedChildrenDescription("object", "pojo") ==
            "Supports: optional attr of any type, optional field of any type");
}

TEST_CASE("Literal requirements are tried before wildcards", "[registry]") {
    TypeRegistry registry;
    registry.RegisterTypes({
        TypeDefinitionBuilder("field", "base").Build(),
        TypeDefinitionBuilder("field", "long").InheritsFrom("field", "base").Build(),
        TypeDefinitionBuilder("field", "string").InheritsFrom("field", "base").Build(),
        TypeDefinitionBuilder("attr", "base").Build(),
        TypeDefinitionBuilder("object", "base").RequiredChild("id", "field", "long").AnyChild("field").Build(),
        TypeDefinitionBuilder("object", "strict").RequiredChild("id", "field", "long").Build(),
    });

    const auto literalMatch = registry.MatchPlacement("object", "base", "field", "long", "id");
    REQUIRE(literalMatch.has_value());
    REQUIRE(literalMatch->IsLiteral());

    // An unsatisfied literal falls through to the wildcard requirement.
    const auto fallback = registry.MatchPlacement("object", "base", "field", "string", "id");
    REQUIRE(fallback.has_value());
    REQUIRE_FALSE(fallback->IsLiteral());
    REQUIRE(registry.AcceptsChild("object", "base", "field", "string", "id"));

    // Without a wildcard nothing admits the child.
    REQUIRE(registry.AcceptsChild("object", "strict", "field", "long", "id"));
    REQUIRE_FALSE(registry.AcceptsChild("object", "strict", "field", "string", "id"));
    REQUIRE_FALSE(registry.AcceptsChild("object", "base", "attr", "base", "id"));
}

TEST_CASE("Standard catalog admits attributes through the wildcard requirement", "[registry]") {
    auto registry = mo::test::CreateStandardRegistry();

    // field.base declares attr 'required' as boolean plus wildcard attr and validator children.
    REQUIRE(registry->AcceptsChild("field", "string", "attr", "boolean", "required"));
    REQUIRE(registry->AcceptsChild("field", "string", "attr", "string", "required"));
    REQUIRE(registry->AcceptsChild("field", "string", "attr", "string", "label"));
    REQUIRE(registry->AcceptsChild("field", "string", "validator", "required", "required"));

    const auto literal = registry->FindChildRequirement("field", "string", "required");
    REQUIRE(literal.has_value());
    REQUIRE(literal->Requirement().ExpectedSubType() == "boolean");
    REQUIRE_FALSE(registry->FindChildRequirement("field", "string", "nothing").has_value());
    REQUIRE_FALSE(registry->FindChildRequirement("nothing", "here", "required").has_value());
}

TEST_CASE("Batch registration resolves parents inside the batch", "[registry]") {
    TypeRegistry registry;
    registry.RegisterTypes({
        TypeDefinitionBuilder("object", "pojo").InheritsFrom("object", "base").Build(),
        TypeDefinitionBuilder("object", "base").Build(),
    });
    REQUIRE(registry.IsRegistered("object", "pojo"));

    REQUIRE_THROWS_AS(registry.RegisterType(TypeDefinitionBuilder("field", "int").InheritsFrom("field", "base").Build()),
                      mo::core::UnknownParentError);
}

TEST_CASE("Inheritance cycles are rejected without partial registration", "[registry]") {
    TypeRegistry registry;
    registry.RegisterType(TypeDefinitionBuilder("metadata", "base").Build());

    try {
        registry.RegisterTypes({
            TypeDefinitionBuilder("object", "c").InheritsFrom("metadata", "base").Build(),
            TypeDefinitionBuilder("object", "a").InheritsFrom("object", "b").Build(),
            TypeDefinitionBuilder("object", "b").InheritsFrom("object", "a").Build(),
        });
        FAIL("expected CircularReferenceError");
    } catch (const mo::core::CircularReferenceError& e) {
        REQUIRE(e.cycle().size() == 3);
        REQUIRE(e.cycle().front() == e.cycle().back());
    }

    REQUIRE_FALSE(registry.IsRegistered("object", "a"));
    REQUIRE_FALSE(registry.IsRegistered("object", "b"));
    REQUIRE_FALSE(registry.IsRegistered("object", "c"));
    REQUIRE(registry.GetAllTypeDefinitions().size() == 1);

    REQUIRE_THROWS_AS(TypeDefinitionBuilder("object", "self").InheritsFrom("object", "self").Build(),
                      mo::core::CircularReferenceError);
}

TEST_CASE("Replacing a type while open invalidates only its subtree", "[registry]") {
    TypeRegistry registry;
    registry.RegisterTypes({
        TypeDefinitionBuilder("attr", "base").Build(),
        TypeDefinitionBuilder("attr", "string").InheritsFrom("attr", "base").Build(),
        TypeDefinitionBuilder("field", "base").Build(),
        TypeDefinitionBuilder("field", "string").InheritsFrom("field", "base").Build(),
        TypeDefinitionBuilder("object", "pojo").AnyChild("field").Build(),
    }, "app");

    const auto pojoBefore = registry.GetInheritedChildRequirements("object", "pojo");
    const auto stringBefore = registry.GetInheritedChildRequirements("field", "string");
    REQUIRE(stringBefore->empty());

    registry.RegisterType(TypeDefinitionBuilder("field", "base").OptionalChild("label", "attr", "string").Build(),
                          "app");

    REQUIRE(registry.GetInheritedChildRequirements("object", "pojo") == pojoBefore);
    const auto stringAfter = registry.GetInheritedChildRequirements("field", "string");
    REQUIRE(stringAfter != stringBefore);
    REQUIRE(stringAfter->contains("label"));
}

TEST_CASE("Sealed registry serves frozen views and only accepts new types", "[registry]") {
    TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);
    registry.Seal();
    REQUIRE(registry.IsSealed());

    const auto first = registry.GetInheritedChildRequirements("object", "pojo");
    REQUIRE(registry.GetInheritedChildRequirements("object", "pojo") == first);

    SECTION("Replacement is rejected") {
        REQUIRE_THROWS_AS(registry.RegisterType(TypeDefinitionBuilder("field", "string")
                                                    .InheritsFrom("field", "base")
                                                    .Describe("changed")
                                                    .Build(),
                                                "minimal"),
                          mo::core::DuplicateTypeError);
    }

    SECTION("New types can still be added") {
        registry.RegisterType(TypeDefinitionBuilder("field", "date").InheritsFrom("field", "base").Build(), "late");
        REQUIRE(registry.IsRegistered("field", "date"));
        REQUIRE(registry.GetInheritedChildRequirements("field", "date")->contains("*:attr:*"));
        REQUIRE(registry.GetInheritedChildRequirements("object", "pojo") == first);
    }
}

TEST_CASE("Closed registry rejects every call", "[registry]") {
    TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);
    registry.Close();

    REQUIRE(registry.Phase() == mo::registry::RegistryPhase::Closed);
    REQUIRE_THROWS_AS(registry.FindTypeDefinition("field", "string"), mo::core::StateError);
    REQUIRE_THROWS_AS(registry.RegisterType(TypeDefinitionBuilder("x", "y").Build()), mo::core::StateError);
    REQUIRE_THROWS_AS(registry.Seal(), mo::core::StateError);
}

TEST_CASE("Registry statistics and health report describe the catalog", "[registry]") {
    auto registry = mo::test::CreateStandardRegistry();

    const auto stats = registry->GetStats();
    REQUIRE(stats.phase == mo::registry::RegistryPhase::Sealed);
    REQUIRE(stats.typesPerCategory.at("field") == 10);
    REQUIRE(stats.providerCount == 2);
    REQUIRE(stats.requirementCache.permanentSize == stats.typeCount);

    const auto json = TypeRegistry::ToJson(stats);
    REQUIRE(json["typeCount"] == stats.typeCount);
    REQUIRE(json["phase"] == "Sealed");

    const auto health = registry->ValidateConsistency();
    REQUIRE(health.IsHealthy());
    REQUIRE(health.typeCount == stats.typeCount);
}

TEST_CASE("Health report flags constraints without attribute types", "[registry]") {
    TypeRegistry registry;
    registry.RegisterTypes({
        TypeDefinitionBuilder("attr", "base").Build(),
        TypeDefinitionBuilder("attr", "string").InheritsFrom("attr", "base").Build(),
        TypeDefinitionBuilder("field", "base")
            .Attribute(ValidationConstraint::ForAttribute("size").OfInt().Single().Build())
            .Build(),
    });

    const auto health = registry.ValidateConsistency();
    REQUIRE_FALSE(health.IsHealthy());
    REQUIRE(health.errors.size() == 1);
    REQUIRE(health.errors.front().find("attr.int") != std::string::npos);
}
