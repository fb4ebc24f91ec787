#include "mo/metadata/MetaDataNode.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

#include "mo/constraint/ConstraintEngine.hpp"
#include "mo/core/Error.hpp"
#include "mo/metadata/MetaAttribute.hpp"
#include "mo/registry/TypeDefinition.hpp"
#include "mo/registry/TypeRegistry.hpp"
#include "TestTypeHelpers.hpp"

using mo::metadata::MetaAttribute;
using mo::metadata::MetaDataNode;
using mo::metadata::NodeState;
using nlohmann::json;

namespace {

std::vector<std::string> NamesOf(const MetaDataNode::NodeList& nodes) {
    std::vector<std::string> names;
    for (const auto* node : nodes) {
        names.push_back(node->Name());
    }
    return names;
}

} // namespace

TEST_CASE("Wildcard field requirement admits named fields once", "[node]") {
    mo::registry::TypeRegistry registry;
    mo::test::RegisterMinimalCatalog(registry);
    mo::constraint::ConstraintEngine engine(registry);

    auto user = MetaDataNode::Create(engine, "object", "pojo", "User");
    auto& email = user->AddChild(MetaDataNode::Create(engine, "field", "string", "email"));
    REQUIRE(email.Parent() == user.get());
    REQUIRE(user->GetChildren()->size() == 1);

    REQUIRE_THROWS_AS(user->AddChild(MetaDataNode::Create(engine, "field", "string", "email")),
                      mo::core::DuplicateChildNameError);
    REQUIRE(user->GetChildren()->size() == 1);
}

TEST_CASE("Enumerated attribute accepts listed values only", "[node]") {
    mo::test::MetadataFixture fixture;
    auto identity = fixture.Node("identity", "primary", "id");

    auto& generation = identity->SetAttribute("generation", "uuid");
    REQUIRE(generation.Value() == "uuid");

    try {
        identity->SetAttribute("generation", "sequential");
        FAIL("expected ValueConstraintViolationError");
    } catch (const mo::core::ValueConstraintViolationError& e) {
        REQUIRE(e.allowedValues() == std::vector<std::string>{"increment", "uuid", "assigned"});
    }
    REQUIRE(identity->GetAttributeAs<std::string>("generation") == "uuid");
}

TEST_CASE("Nodes can only be created for registered types", "[node]") {
    mo::test::MetadataFixture fixture;
    REQUIRE_THROWS_AS(fixture.Node("validator", "creditCard", "card"), mo::core::NotFoundError);
}

TEST_CASE("Node identity splits package and short name", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.Node("object", "pojo", "acme::crm::User");

    REQUIRE(user->ShortName() == "User");
    REQUIRE(user->Package() == "acme::crm");
    REQUIRE(user->Id().QualifiedName() == "object.pojo");
    REQUIRE(user->State() == NodeState::Uninitialized);
    REQUIRE(user->ToString() == "MetaDataNode[object:pojo]{acme::crm::User}");
}

TEST_CASE("AddChild rejects illegal structures", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();

    SECTION("Null child") {
        REQUIRE_THROWS_AS(user->AddChild(nullptr), mo::core::StructureError);
    }

    SECTION("Placement outside the declared requirements") {
        REQUIRE_THROWS_AS(user->AddChild(fixture.Node("loader", "simple", "nested")),
                          mo::core::PlacementViolationError);
    }

    SECTION("Attributes cannot have children") {
        auto& flag = user->SetAttribute("isAbstract", false);
        REQUIRE_THROWS_AS(flag.AddChild(fixture.Node("field", "string", "x")), mo::core::StructureError);
    }

    SECTION("Same name under another type is fine") {
        REQUIRE_NOTHROW(user->AddChild(fixture.Node("validator", "required", "email")));
    }
}

TEST_CASE("Attributes replace existing values and are looked up by name", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();

    user->SetAttribute("className", "com.acme.User");
    user->SetAttribute("className", "com.acme.Customer");
    REQUIRE(user->GetChildrenOfType("attr")->size() == 1);
    REQUIRE(user->RequireAttribute("className") == "com.acme.Customer");

    user->SetAttribute("note", "temporary");
    user->SetAttribute("note", 5);
    REQUIRE(user->FindAttribute("note")->SubType() == "int");
    REQUIRE(user->GetAttributeAs<int>("note") == 5);
    REQUIRE_FALSE(user->GetAttributeAs<std::string>("note").has_value());

    REQUIRE_FALSE(user->HasAttribute("missing"));
    REQUIRE_FALSE(user->GetAttribute("missing").has_value());
    REQUIRE_THROWS_AS(user->RequireAttribute("missing"), mo::core::NotFoundError);

    REQUIRE_THROWS_AS(user->SetAttribute("isAbstract", "yes"), mo::core::ValueConstraintViolationError);
}

TEST_CASE("MetaAttribute values are validated against the owner", "[node]") {
    mo::test::MetadataFixture fixture;
    auto identity = fixture.Node("identity", "primary", "id");
    auto& generation = identity->SetAttribute("generation", "increment");

    generation.SetValue("assigned");
    REQUIRE(identity->RequireAttribute("generation") == "assigned");
    REQUIRE_THROWS_AS(generation.SetValue("sequential"), mo::core::ValueConstraintViolationError);
    REQUIRE_THROWS_AS(generation.SetValue(3), mo::core::ValueConstraintViolationError);

    auto detached = MetaAttribute::Create(*fixture.engine, "tags", json::array({"a", "b"}));
    REQUIRE(detached->SubType() == "stringarray");
    REQUIRE_THROWS_AS(MetaAttribute::Create(*fixture.engine, "bad", json::object()),
                      mo::core::ValueConstraintViolationError);
}

TEST_CASE("Attributes attached with AddChild are validated like SetAttribute", "[node]") {
    mo::test::MetadataFixture fixture;
    auto identity = fixture.Node("identity", "primary", "id");

    REQUIRE_THROWS_AS(identity->AddChild(MetaAttribute::Create(*fixture.engine, "generation", "sequential")),
                      mo::core::ValueConstraintViolationError);
    REQUIRE_FALSE(identity->HasAttribute("generation"));

    identity->AddChild(MetaAttribute::Create(*fixture.engine, "generation", "uuid"));
    REQUIRE(identity->RequireAttribute("generation") == "uuid");

    auto email = fixture.Node("field", "string", "email");
    REQUIRE_THROWS_AS(email->AddChild(MetaAttribute::Create(*fixture.engine, "required", "yes")),
                      mo::core::ValueConstraintViolationError);
    try {
        email->AddChild(std::make_unique<MetaAttribute>(*fixture.engine, "string", "required", true));
        FAIL("expected ValueConstraintViolationError");
    } catch (const mo::core::ValueConstraintViolationError& e) {
        REQUIRE(e.rule() == "kind");
        REQUIRE(e.attributeName() == "required");
    }
    REQUIRE_FALSE(email->HasAttribute("required"));

    email->AddChild(MetaAttribute::Create(*fixture.engine, "required", true));
    REQUIRE(email->GetAttributeAs<bool>("required") == true);
}

TEST_CASE("RequireChild reports the full path and alternatives", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();
    const auto& email = user->RequireChild("email", "field");
    auto& validator = const_cast<MetaDataNode&>(email).AddChild(fixture.Node("validator", "required", "required"));

    REQUIRE(validator.Path() == "object:acme::User → field:email → validator:required");
    REQUIRE(user->FindChild("phone") == nullptr);

    try {
        (void)user->RequireChild("phone", "field");
        FAIL("expected NotFoundError");
    } catch (const mo::core::NotFoundError& e) {
        const std::string message = e.what();
        REQUIRE(message.find("object:acme::User → field:phone") != std::string::npos);
        REQUIRE(e.alternatives() == std::vector<std::string>{"field:email", "field:age"});
    }
}

TEST_CASE("RemoveChild detaches the node", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();

    auto age = user->RemoveChild("field", "age");
    REQUIRE(age->Parent() == nullptr);
    REQUIRE(NamesOf(*user->GetChildren()) == std::vector<std::string>{"email"});
    REQUIRE_THROWS_AS(user->RemoveChild("field", "age"), mo::core::NotFoundError);

    user->AddChild(std::move(age));
    REQUIRE(NamesOf(*user->GetChildren()) == std::vector<std::string>{"email", "age"});
}

TEST_CASE("Super nodes supply inherited children", "[node]") {
    mo::test::MetadataFixture fixture;
    auto base = fixture.Node("object", "pojo", "acme::Entity");
    base->AddChild(fixture.Node("field", "long", "id"));
    base->AddChild(fixture.Node("field", "string", "email"));
    base->SetAttribute("_internal", true);
    base->SetAttribute("className", "com.acme.Entity");

    auto user = fixture.UserObject();
    user->SetSuperNode(base.get());

    const auto all = user->GetAllChildren(true);
    REQUIRE(NamesOf(*all) == std::vector<std::string>{"email", "age", "id", "className"});
    REQUIRE(NamesOf(*user->GetChildrenOfType("field", true)) == std::vector<std::string>{"email", "age", "id"});
    REQUIRE(user->FindChild("id", "field") != nullptr);
    REQUIRE(user->FindChild("id", "field", false) == nullptr);
    REQUIRE(user->GetAttributeAs<std::string>("className") == "com.acme.Entity");
    REQUIRE_FALSE(user->HasAttribute("_internal"));

    SECTION("Own children shadow inherited ones") {
        const auto* email = user->FindChild("email", "field");
        REQUIRE(email->Parent() == user.get());
    }

    SECTION("Changes to the super node reach dependents") {
        const auto before = user->GetChildrenOfType("field", true);
        base->AddChild(fixture.Node("field", "date", "createdOn"));
        const auto after = user->GetChildrenOfType("field", true);
        REQUIRE(before != after);
        REQUIRE(after->size() == 4);
    }

    SECTION("Super node must have the same type") {
        auto field = fixture.Node("field", "string", "other");
        REQUIRE_THROWS_AS(user->SetSuperNode(field.get()), mo::core::StructureError);
    }

    SECTION("Super node cycles are rejected") {
        try {
            base->SetSuperNode(user.get());
            FAIL("expected SuperNodeCycleError");
        } catch (const mo::core::StructureError& e) {
            const auto* cycle = dynamic_cast<const mo::core::SuperNodeCycleError*>(&e);
            REQUIRE(cycle != nullptr);
            REQUIRE(cycle->cycle().front() == cycle->cycle().back());
        }
        REQUIRE_THROWS_AS(user->SetSuperNode(user.get()), mo::core::SuperNodeCycleError);
    }
}

TEST_CASE("Required fields are derived from the required attribute", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();

    REQUIRE(NamesOf(*user->GetRequiredFields()) == std::vector<std::string>{"email"});

    auto* age = const_cast<MetaDataNode*>(user->FindChild("age", "field"));
    age->SetAttribute("required", true);
    REQUIRE(NamesOf(*user->GetRequiredFields()) == std::vector<std::string>{"email", "age"});
}

TEST_CASE("Invalidation is scoped to the mutated node, its ancestors and dependents", "[node]") {
    mo::test::MetadataFixture fixture;
    auto root = fixture.Node("loader", "simple", "root");
    auto& user = root->AddChild(fixture.UserObject());
    auto& order = root->AddChild(fixture.Node("object", "pojo", "acme::Order"));
    order.AddChild(fixture.Node("field", "double", "total"));

    const auto orderFields = order.GetChildrenOfType("field");
    const auto userFields = user.GetChildrenOfType("field");
    const auto rootObjects = root->GetChildrenOfType("object");

    user.AddChild(fixture.Node("field", "boolean", "active"));

    REQUIRE(order.GetChildrenOfType("field") == orderFields);
    REQUIRE(user.GetChildrenOfType("field") != userFields);
    REQUIRE(user.GetChildrenOfType("field")->size() == 3);
    // Ancestors lose their derived lists; the objects are unchanged.
    REQUIRE(*root->GetChildrenOfType("object") == *rootObjects);
    REQUIRE(root->GetCacheStats().loads >= 2);
}

TEST_CASE("Clone deep-copies the subtree and remaps internal super references", "[node]") {
    mo::test::MetadataFixture fixture;
    auto root = fixture.Node("loader", "simple", "root");
    auto external = fixture.Node("object", "pojo", "acme::External");
    external->AddChild(fixture.Node("field", "string", "ref"));

    auto& base = root->AddChild(fixture.Node("object", "pojo", "acme::Base"));
    base.AddChild(fixture.Node("field", "long", "id"));
    auto& user = root->AddChild(fixture.UserObject());
    user.SetSuperNode(&base);
    auto& audit = root->AddChild(fixture.Node("object", "value", "acme::Audit"));
    audit.SetSuperNode(nullptr);
    auto& linked = root->AddChild(fixture.Node("object", "pojo", "acme::Linked"));
    linked.SetSuperNode(external.get());

    auto copy = root->Clone();

    REQUIRE(copy->Parent() == nullptr);
    REQUIRE(copy->State() == NodeState::UnderConstruction);
    REQUIRE(copy->GetChildren()->size() == root->GetChildren()->size());

    const auto* copiedBase = copy->FindChild("acme::Base", "object");
    const auto* copiedUser = copy->FindChild("acme::User", "object");
    const auto* copiedLinked = copy->FindChild("acme::Linked", "object");
    REQUIRE(copiedBase != &base);
    REQUIRE(copiedUser->Parent() == copy.get());
    REQUIRE(copiedUser->SuperNode() == copiedBase);
    REQUIRE(copiedLinked->SuperNode() == external.get());
    REQUIRE(copiedUser->FindChild("id", "field") == copiedBase->FindChild("id", "field"));
    REQUIRE(copiedUser->RequireChild("email", "field").GetAttributeAs<bool>("required") == true);

    SECTION("Mutating the copy leaves the original untouched") {
        auto* mutableUser = const_cast<MetaDataNode*>(copiedUser);
        mutableUser->AddChild(fixture.Node("field", "date", "createdOn"));
        REQUIRE(user.GetChildrenOfType("field")->size() == 2);
        REQUIRE(mutableUser->GetChildrenOfType("field")->size() == 3);
    }

    SECTION("Destroying the original external super clears the link") {
        external.reset();
        REQUIRE(copiedLinked->SuperNode() == nullptr);
        REQUIRE(linked.SuperNode() == nullptr);
    }
}

TEST_CASE("Overload creates an empty node inheriting from the original", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();

    auto special = user->Overload();
    REQUIRE(special->Name() == user->Name());
    REQUIRE(special->SuperNode() == user.get());
    REQUIRE(special->GetChildren()->empty());
    REQUIRE(special->GetChildrenOfType("field", true)->size() == 2);

    special->AddChild(fixture.Node("field", "string", "nickname"));
    REQUIRE(user->GetChildrenOfType("field")->size() == 2);
}

TEST_CASE("Destroying a base node refreshes every overload built on it", "[node]") {
    mo::test::MetadataFixture fixture;
    auto base = fixture.Node("object", "pojo", "acme::Base");
    base->AddChild(fixture.Node("field", "long", "id"));

    auto middle = base->Overload();
    auto leaf = middle->Overload();
    leaf->AddChild(fixture.Node("field", "string", "label"));
    REQUIRE(NamesOf(*leaf->GetAllChildren(true)) == std::vector<std::string>{"label", "id"});
    REQUIRE(NamesOf(*middle->GetAllChildren(true)) == std::vector<std::string>{"id"});

    base.reset();

    REQUIRE(middle->SuperNode() == nullptr);
    REQUIRE(leaf->SuperNode() == middle.get());
    REQUIRE(middle->GetAllChildren(true)->empty());
    REQUIRE(NamesOf(*leaf->GetAllChildren(true)) == std::vector<std::string>{"label"});
    REQUIRE(leaf->FindChild("id", "field") == nullptr);
}

TEST_CASE("Sealed nodes reject mutation and keep serving reads", "[node]") {
    mo::test::MetadataFixture fixture;
    auto user = fixture.UserObject();
    auto* email = const_cast<MetaDataNode*>(user->FindChild("email", "field"));

    user->Seal();
    REQUIRE(user->IsSealed());
    REQUIRE(email->IsSealed());

    REQUIRE_THROWS_AS(user->AddChild(fixture.Node("field", "string", "late")), mo::core::StateError);
    REQUIRE_THROWS_AS(user->SetAttribute("className", "x"), mo::core::StateError);
    REQUIRE_THROWS_AS(email->SetAttribute("required", false), mo::core::StateError);
    REQUIRE_THROWS_AS(user->RemoveChild("field", "age"), mo::core::StateError);
    REQUIRE_THROWS_AS(user->SetSuperNode(nullptr), mo::core::StateError);

    const auto fields = user->GetChildrenOfType("field");
    REQUIRE(user->GetChildrenOfType("field") == fields);
    REQUIRE(NamesOf(*user->GetRequiredFields()) == std::vector<std::string>{"email"});

    SECTION("Sealed nodes cannot be attached elsewhere") {
        auto other = fixture.Node("object", "pojo", "Other");
        auto sealedChild = fixture.Node("field", "string", "sealed");
        sealedChild->Seal();
        REQUIRE_THROWS_AS(other->AddChild(std::move(sealedChild)), mo::core::StateError);
    }

    SECTION("Destroy moves the tree to the terminal state") {
        user->Destroy();
        REQUIRE(user->State() == NodeState::Destroyed);
        REQUIRE(email->State() == NodeState::Destroyed);
        REQUIRE_THROWS_AS(user->Seal(), mo::core::StateError);
    }
}
