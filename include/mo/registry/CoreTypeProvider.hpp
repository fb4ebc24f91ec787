#pragma once

#include <string>
#include <vector>

#include "mo/registry/TypeProvider.hpp"

namespace mo::registry {

class RegistryBootstrap;

namespace types {

inline constexpr const char* kMetadata = "metadata";
inline constexpr const char* kLoader = "loader";
inline constexpr const char* kObject = "object";
inline constexpr const char* kField = "field";
inline constexpr const char* kAttr = "attr";
inline constexpr const char* kValidator = "validator";
inline constexpr const char* kIdentity = "identity";
inline constexpr const char* kKey = "key";

} // namespace types

/**
 * @brief Registers the root, loader, object, attribute, validator, identity and key types.
 */
class CoreTypeProvider : public TypeProvider {
public:
    static constexpr const char* kId = "core-types";

    std::string Id() const override { return kId; }
    int Priority() const override { return 100; }
    std::string Description() const override { return "Core metadata types"; }
    void RegisterTypes(TypeRegistry& registry) override;
};

/**
 * @brief Registers field.base and the concrete field subtypes.
 */
class FieldTypeProvider : public TypeProvider {
public:
    static constexpr const char* kId = "field-types";

    std::string Id() const override { return kId; }
    std::vector<std::string> Dependencies() const override { return {CoreTypeProvider::kId}; }
    int Priority() const override { return 90; }
    std::string Description() const override { return "Field types"; }
    void RegisterTypes(TypeRegistry& registry) override;
};

/// Adds CoreTypeProvider and FieldTypeProvider.
void AddStandardProviders(RegistryBootstrap& bootstrap);

} // namespace mo::registry
