#include "mo/registry/CoreTypeProvider.hpp"

#include <memory>

#include "mo/constraint/ValidationConstraint.hpp"
#include "mo/registry/RegistryBootstrap.hpp"
#include "mo/registry/TypeDefinition.hpp"
#include "mo/registry/TypeRegistry.hpp"

namespace mo::registry {

namespace {

using constraint::Cardinality;
using constraint::ValidationConstraint;
using constraint::ValueKind;

constexpr const char* kBase = "base";

ValidationConstraint BooleanAttribute(const char* name, const char* description) {
    return ValidationConstraint::ForAttribute(name).OfBoolean().Single().Describe(description).Build();
}

ValidationConstraint StringAttribute(const char* name, const char* description) {
    return ValidationConstraint::ForAttribute(name).OfString().Single().Describe(description).Build();
}

TypeDefinitionBuilder CategoryBase(const char* category, const char* description) {
    TypeDefinitionBuilder builder(category, kBase);
    builder.InheritsFrom(types::kMetadata, kBase).Describe(description);
    return builder;
}

std::vector<TypeRegistry::DefinitionPtr> AttributeTypes() {
    std::vector<TypeRegistry::DefinitionPtr> definitions;
    definitions.push_back(TypeDefinitionBuilder(types::kAttr, kBase)
                              .Describe("Base attribute")
                              .Implementation("MetaAttribute")
                              .Build());

    const ValueKind kinds[] = {ValueKind::String, ValueKind::Int, ValueKind::Long, ValueKind::Double,
                               ValueKind::Boolean};
    for (ValueKind kind : kinds) {
        for (Cardinality cardinality : {Cardinality::Single, Cardinality::Array}) {
            const std::string subType = constraint::AttributeSubType(kind, cardinality);
            definitions.push_back(TypeDefinitionBuilder(types::kAttr, subType)
                                      .InheritsFrom(types::kAttr, kBase)
                                      .Describe(subType + " attribute")
                                      .Implementation("MetaAttribute")
                                      .Build());
        }
    }
    return definitions;
}

} // namespace

void CoreTypeProvider::RegisterTypes(TypeRegistry& registry) {
    std::vector<TypeRegistry::DefinitionPtr> definitions = AttributeTypes();

    definitions.push_back(TypeDefinitionBuilder(types::kMetadata, kBase)
                              .Describe("Root of every metadata type")
                              .AnyChild(types::kAttr)
                              .Build());

    definitions.push_back(TypeDefinitionBuilder(types::kLoader, "simple")
                              .InheritsFrom(types::kMetadata, kBase)
                              .Describe("In-memory metadata loader root")
                              .Implementation("MetaDataLoader")
                              .AnyChild(types::kObject)
                              .Build());

    // Objects
    definitions.push_back(CategoryBase(types::kObject, "Base object")
                              .Implementation("MetaObject")
                              .AnyChild(types::kField)
                              .AnyChild(types::kIdentity)
                              .AnyChild(types::kKey)
                              .AnyChild(types::kValidator)
                              .Attribute(BooleanAttribute("isAbstract", "Object cannot be instantiated"))
                              .Attribute(BooleanAttribute("isInterface", "Object is an interface"))
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kObject, "pojo")
                              .InheritsFrom(types::kObject, kBase)
                              .Describe("Object bound to a native class")
                              .Implementation("PojoMetaObject")
                              .Attribute(StringAttribute("className", "Implementation class name"))
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kObject, "proxy")
                              .InheritsFrom(types::kObject, kBase)
                              .Describe("Object backed by a generated proxy")
                              .Implementation("ProxyMetaObject")
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kObject, "value")
                              .InheritsFrom(types::kObject, kBase)
                              .Describe("Dynamic value object")
                              .Implementation("ValueMetaObject")
                              .Build());

    // Validators
    definitions.push_back(CategoryBase(types::kValidator, "Base validator")
                              .Implementation("MetaValidator")
                              .Attribute(StringAttribute("msg", "Message reported on failure"))
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kValidator, "required")
                              .InheritsFrom(types::kValidator, kBase)
                              .Describe("Value must be present")
                              .Implementation("RequiredValidator")
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kValidator, "regex")
                              .InheritsFrom(types::kValidator, kBase)
                              .Describe("Value must match a pattern")
                              .Implementation("RegexValidator")
                              .Attribute(ValidationConstraint::ForAttribute("mask")
                                             .OfString()
                                             .Single()
                                             .Required()
                                             .Describe("Regular expression")
                                             .Build())
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kValidator, "length")
                              .InheritsFrom(types::kValidator, kBase)
                              .Describe("String length bounds")
                              .Implementation("LengthValidator")
                              .Attribute(ValidationConstraint::ForAttribute("min").OfInt().Single().AtLeast(0).Build())
                              .Attribute(ValidationConstraint::ForAttribute("max").OfInt().Single().AtLeast(0).Build())
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kValidator, "numeric")
                              .InheritsFrom(types::kValidator, kBase)
                              .Describe("Numeric bounds")
                              .Implementation("NumericValidator")
                              .Attribute(ValidationConstraint::ForAttribute("min").OfDouble().Single().Build())
                              .Attribute(ValidationConstraint::ForAttribute("max").OfDouble().Single().Build())
                              .Build());

    // Identities
    definitions.push_back(CategoryBase(types::kIdentity, "Base identity")
                              .Implementation("MetaIdentity")
                              .Attribute(ValidationConstraint::ForAttribute("fields")
                                             .OfString()
                                             .Array()
                                             .Required()
                                             .Describe("Fields forming the identity")
                                             .Build())
                              .Attribute(ValidationConstraint::ForAttribute("generation")
                                             .OfString()
                                             .Single()
                                             .OneOf({"increment", "uuid", "assigned"})
                                             .Describe("How identity values are generated")
                                             .Build())
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kIdentity, "primary")
                              .InheritsFrom(types::kIdentity, kBase)
                              .Describe("Primary identity")
                              .Implementation("PrimaryIdentity")
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kIdentity, "secondary")
                              .InheritsFrom(types::kIdentity, kBase)
                              .Describe("Secondary identity")
                              .Implementation("SecondaryIdentity")
                              .Build());

    // Keys
    definitions.push_back(CategoryBase(types::kKey, "Base key")
                              .Implementation("MetaKey")
                              .Attribute(ValidationConstraint::ForAttribute("keys")
                                             .OfString()
                                             .Array()
                                             .Describe("Fields forming the key")
                                             .Build())
                              .Build());
    definitions.push_back(TypeDefinitionBuilder(types::kKey, "foreign")
                              .InheritsFrom(types::kKey, kBase)
                              .Describe("Reference to another object")
                              .Implementation("ForeignKey")
                              .Attribute(ValidationConstraint::ForAttribute("foreignObjectRef")
                                             .OfString()
                                             .Single()
                                             .Required()
                                             .Build())
                              .Build());

    registry.RegisterTypes(definitions, Id());
}

void FieldTypeProvider::RegisterTypes(TypeRegistry& registry) {
    std::vector<TypeRegistry::DefinitionPtr> definitions;

    definitions.push_back(CategoryBase(types::kField, "Base field")
                              .Implementation("MetaField")
                              .AnyChild(types::kValidator)
                              .Attribute(BooleanAttribute("required", "Value must be set"))
                              .Attribute(StringAttribute("defaultValue", "Default value"))
                              .Attribute(StringAttribute("defaultView", "Default view name"))
                              .Attribute(BooleanAttribute("isOptional", "Field may be absent"))
                              .Attribute(BooleanAttribute("isReadOnly", "Field cannot be written"))
                              .Build());

    auto field = [](const char* subType, const char* description) {
        TypeDefinitionBuilder builder(types::kField, subType);
        builder.InheritsFrom(types::kField, kBase).Describe(description).Implementation("MetaField");
        return builder;
    };

    definitions.push_back(field("string", "String field")
                              .Attribute(ValidationConstraint::ForAttribute("maxLength").OfInt().Single().AtLeast(0).Build())
                              .Attribute(StringAttribute("pattern", "Pattern the value must match"))
                              .Build());
    definitions.push_back(field("int", "32-bit integer field")
                              .Attribute(ValidationConstraint::ForAttribute("minValue").OfInt().Single().Build())
                              .Attribute(ValidationConstraint::ForAttribute("maxValue").OfInt().Single().Build())
                              .Build());
    definitions.push_back(field("long", "64-bit integer field")
                              .Attribute(ValidationConstraint::ForAttribute("minValue").OfLong().Single().Build())
                              .Attribute(ValidationConstraint::ForAttribute("maxValue").OfLong().Single().Build())
                              .Build());
    definitions.push_back(field("double", "Floating point field")
                              .Attribute(ValidationConstraint::ForAttribute("minValue").OfDouble().Single().Build())
                              .Attribute(ValidationConstraint::ForAttribute("maxValue").OfDouble().Single().Build())
                              .Build());
    definitions.push_back(field("boolean", "Boolean field").Build());
    definitions.push_back(field("date", "Date field")
                              .Attribute(StringAttribute("format", "Date format"))
                              .Build());
    definitions.push_back(field("object", "Reference to one object")
                              .Attribute(StringAttribute("objectRef", "Referenced object name"))
                              .Build());
    definitions.push_back(field("objectarray", "Array of objects")
                              .Attribute(StringAttribute("objectRef", "Referenced object name"))
                              .Build());
    definitions.push_back(field("stringarray", "Array of strings")
                              .Attribute(ValidationConstraint::ForAttribute("maxLength").OfInt().Single().AtLeast(0).Build())
                              .Build());

    registry.RegisterTypes(definitions, Id());
}

void AddStandardProviders(RegistryBootstrap& bootstrap) {
    bootstrap.AddProvider(std::make_unique<CoreTypeProvider>());
    bootstrap.AddProvider(std::make_unique<FieldTypeProvider>());
}

} // namespace mo::registry
