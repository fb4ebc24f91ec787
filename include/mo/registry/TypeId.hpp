#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace mo::registry {

inline constexpr std::string_view kWildcard = "*";
inline constexpr std::string_view kBaseSubType = "base";

inline std::string NormalizeTypeName(std::string_view name) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

inline bool IsWildcard(std::string_view value) {
    return value == kWildcard;
}

/**
 * @brief (type, subType) pair identifying one registered metadata type.
 *
 * Both parts are stored lower-case. "*" on either axis is a wildcard and only
 * meaningful inside requirements, never as a registered type.
 */
struct TypeId {
    std::string type;
    std::string subType;

    TypeId() = default;
    TypeId(std::string_view typeName, std::string_view subTypeName)
        : type(NormalizeTypeName(typeName)),
          subType(NormalizeTypeName(subTypeName)) {}

    [[nodiscard]] std::string QualifiedName() const { return type + "." + subType; }
    [[nodiscard]] bool Empty() const { return type.empty() && subType.empty(); }
    [[nodiscard]] bool HasWildcard() const { return IsWildcard(type) || IsWildcard(subType); }

    // Wildcard-aware match: each axis is exact or "*" in this pattern.
    [[nodiscard]] bool Matches(const TypeId& concrete) const {
        return (IsWildcard(type) || type == concrete.type) &&
               (IsWildcard(subType) || subType == concrete.subType);
    }

    bool operator==(const TypeId&) const = default;
    auto operator<=>(const TypeId&) const = default;
};

struct TypeIdHash {
    std::size_t operator()(const TypeId& id) const noexcept {
        const std::size_t h1 = std::hash<std::string>{}(id.type);
        const std::size_t h2 = std::hash<std::string>{}(id.subType);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace mo::registry
