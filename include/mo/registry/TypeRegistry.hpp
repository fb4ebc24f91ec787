#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "mo/cache/DualCache.hpp"
#include "mo/constraint/PlacementConstraint.hpp"
#include "mo/registry/RegistryHealthReport.hpp"
#include "mo/registry/TypeDefinition.hpp"
#include "mo/registry/TypeId.hpp"
#include "mo/utils/Config.hpp"

namespace mo::registry {

enum class RegistryPhase {
    Open,
    Sealed,
    Closed
};

std::string_view ToString(RegistryPhase phase);

/**
 * @brief Catalog of metadata types and resolver of their inheritance.
 *
 * Instances are independent; there is no process-wide registry. The catalog is
 * published as an immutable snapshot and replaced copy-on-write by
 * registration, so lookups never lock. Merged inheritance views live in two
 * DualCaches keyed by TypeId. Seal() precomputes every view into the permanent
 * tiers and freezes them.
 *
 * Registration after Seal() may only add new types. It logs a warning and only
 * touches the new type's cache keys.
 */
class TypeRegistry {
public:
    using DefinitionPtr = std::shared_ptr<const TypeDefinition>;
    using RequirementMap = std::map<std::string, constraint::PlacementConstraint>;
    using ConstraintMap = TypeDefinition::ConstraintMap;

    struct Stats {
        RegistryPhase phase = RegistryPhase::Open;
        std::size_t typeCount = 0;
        std::map<std::string, std::size_t> typesPerCategory;
        std::size_t childRequirementCount = 0;
        std::size_t constraintCount = 0;
        std::size_t providerCount = 0;
        cache::CacheStats requirementCache;
        cache::CacheStats constraintCache;
    };

    explicit TypeRegistry(const utils::CacheConfig& cacheConfig = {});
    ~TypeRegistry();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    // Registration ------------------------------------------------------------
    void RegisterType(DefinitionPtr definition, std::string_view providerId = {});
    void RegisterTypes(const std::vector<DefinitionPtr>& definitions, std::string_view providerId = {});

    // Lookup ------------------------------------------------------------------
    [[nodiscard]] DefinitionPtr GetTypeDefinition(std::string_view type, std::string_view subType) const;
    [[nodiscard]] DefinitionPtr FindTypeDefinition(std::string_view type, std::string_view subType) const;
    [[nodiscard]] bool IsRegistered(std::string_view type, std::string_view subType) const;
    [[nodiscard]] bool HasType(std::string_view type) const;
    [[nodiscard]] std::vector<std::string> GetSubTypes(std::string_view type) const;

    // Inheritance views -------------------------------------------------------
    [[nodiscard]] std::shared_ptr<const RequirementMap> GetInheritedChildRequirements(std::string_view type,
                                                                                      std::string_view subType) const;
    [[nodiscard]] std::vector<ChildRequirement> GetDirectChildRequirements(std::string_view type,
                                                                           std::string_view subType) const;
    [[nodiscard]] std::shared_ptr<const ConstraintMap> GetInheritedConstraints(std::string_view type,
                                                                               std::string_view subType) const;
    [[nodiscard]] std::vector<DefinitionPtr> GetInheritanceChain(std::string_view type,
                                                                 std::string_view subType) const;

    // Placement ---------------------------------------------------------------
    [[nodiscard]] bool AcceptsChild(std::string_view parentType,
                                    std::string_view parentSubType,
                                    std::string_view childType,
                                    std::string_view childSubType,
                                    std::string_view childName) const;

    /// The requirement that admits the child, after precedence. nullopt when none does.
    [[nodiscard]] std::optional<constraint::PlacementConstraint> MatchPlacement(std::string_view parentType,
                                                                                std::string_view parentSubType,
                                                                                std::string_view childType,
                                                                                std::string_view childSubType,
                                                                                std::string_view childName) const;

    /// Literal-name requirement for the child name, if the type (or an ancestor) declares one.
    [[nodiscard]] std::optional<constraint::PlacementConstraint> FindChildRequirement(std::string_view parentType,
                                                                                      std::string_view parentSubType,
                                                                                      std::string_view childName) const;

    [[nodiscard]] std::string GetSupportedChildrenDescription(std::string_view type, std::string_view subType) const;

    // Snapshots ---------------------------------------------------------------
    [[nodiscard]] std::vector<DefinitionPtr> GetAllTypeDefinitions() const;
    [[nodiscard]] std::vector<std::string> GetRegisteredTypeNames() const;
    [[nodiscard]] Stats GetStats() const;
    [[nodiscard]] static nlohmann::json ToJson(const Stats& stats);
    [[nodiscard]] RegistryHealthReport ValidateConsistency() const;

    // Lifecycle ---------------------------------------------------------------
    void Seal();
    void Close();
    [[nodiscard]] RegistryPhase Phase() const { return m_phase.load(std::memory_order_acquire); }
    [[nodiscard]] bool IsSealed() const { return Phase() == RegistryPhase::Sealed; }
    [[nodiscard]] const utils::CacheConfig& GetCacheConfig() const { return m_cacheConfig; }

private:
    struct Catalog {
        std::unordered_map<TypeId, DefinitionPtr, TypeIdHash> definitions;
        std::unordered_map<TypeId, std::vector<TypeId>, TypeIdHash> subTypesOf;
        std::set<std::string> providers;
    };

    using RequirementCache = cache::DualCache<TypeId, std::shared_ptr<const RequirementMap>, TypeIdHash>;
    using ConstraintCache = cache::DualCache<TypeId, std::shared_ptr<const ConstraintMap>, TypeIdHash>;

    std::shared_ptr<const Catalog> Snapshot(std::string_view operation) const;
    void EnsureNotClosed(std::string_view operation) const;

    // Validates and stages one definition into the working catalog. Returns false for a no-op.
    bool Stage(Catalog& working, const DefinitionPtr& definition, bool replacementAllowed) const;
    static void RebuildSubTypeIndex(Catalog& catalog);
    static std::vector<TypeId> CollectDescendants(const Catalog& catalog, const TypeId& root);
    static std::vector<DefinitionPtr> ChainOf(const Catalog& catalog, const TypeId& id);
    static std::vector<DefinitionPtr> OrderParentsFirst(const std::vector<DefinitionPtr>& batch);

    void Publish(std::shared_ptr<const Catalog> next, const std::vector<TypeId>& touched);

    std::shared_ptr<const RequirementMap> ResolveRequirements(const Catalog& catalog, const TypeId& id) const;
    std::shared_ptr<const ConstraintMap> ResolveConstraints(const Catalog& catalog, const TypeId& id) const;

    DefinitionPtr RequireDefinition(const Catalog& catalog, std::string_view type, std::string_view subType) const;

    utils::CacheConfig m_cacheConfig;
    std::atomic<std::shared_ptr<const Catalog>> m_catalog;
    std::atomic<RegistryPhase> m_phase{RegistryPhase::Open};
    std::mutex m_writeMutex;
    // Held shared by view computations while Open, exclusively by writers, so a
    // stale view is never cached after an invalidation.
    mutable std::shared_mutex m_viewMutex;
    mutable RequirementCache m_requirementCache;
    mutable ConstraintCache m_constraintCache;
};

} // namespace mo::registry
