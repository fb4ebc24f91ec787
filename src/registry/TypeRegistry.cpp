#include "mo/registry/TypeRegistry.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "mo/core/Error.hpp"
#include "mo/core/Logger.hpp"

namespace mo::registry {

namespace {

TypeRegistry::DefinitionPtr AttributeToProvider(const TypeRegistry::DefinitionPtr& definition,
                                                std::string_view providerId) {
    if (providerId.empty() || definition->ProviderId() == providerId) {
        return definition;
    }
    return definition->WithProviderId(std::string(providerId));
}

nlohmann::json CacheStatsToJson(const cache::CacheStats& stats) {
    return {
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"loads", stats.loads},
        {"evictions", stats.evictions},
        {"promotions", stats.promotions},
        {"permanentSize", stats.permanentSize},
        {"computedSize", stats.computedSize},
        {"hitRatio", stats.HitRatio()}
    };
}

} // namespace

std::string_view ToString(RegistryPhase phase) {
    switch (phase) {
        case RegistryPhase::Open:   return "Open";
        case RegistryPhase::Sealed: return "Sealed";
        case RegistryPhase::Closed: return "Closed";
    }
    return "Unknown";
}

TypeRegistry::TypeRegistry(const utils::CacheConfig& cacheConfig)
    : m_cacheConfig(cacheConfig),
      m_catalog(std::make_shared<const Catalog>()),
      m_requirementCache({cacheConfig.computedCapacity, cacheConfig.promotionThreshold}),
      m_constraintCache({cacheConfig.computedCapacity, cacheConfig.promotionThreshold}) {}

TypeRegistry::~TypeRegistry() = default;

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void TypeRegistry::RegisterType(DefinitionPtr definition, std::string_view providerId) {
    if (!definition) {
        throw core::RegistrationError("<null>", "definition must not be null");
    }

    std::lock_guard lock(m_writeMutex);
    EnsureNotClosed("register type");

    definition = AttributeToProvider(definition, providerId);
    const TypeId id = definition->Id();
    const bool sealed = IsSealed();

    auto working = std::make_shared<Catalog>(*m_catalog.load(std::memory_order_acquire));
    const bool replacing = working->definitions.contains(id);
    if (!Stage(*working, definition, !sealed)) {
        core::Logger::Debug("[TypeRegistry] {} already registered with an identical definition",
                            id.QualifiedName());
        return;
    }
    RebuildSubTypeIndex(*working);

    std::vector<TypeId> touched = replacing ? CollectDescendants(*working, id) : std::vector<TypeId>{id};
    if (sealed) {
        core::Logger::Warning("[TypeRegistry] Registering {} after seal", id.QualifiedName());
    }
    Publish(std::move(working), touched);

    if (replacing) {
        core::Logger::Info("[TypeRegistry] Replaced {} (provider '{}'), invalidated {} merged view(s)",
                           id.QualifiedName(), definition->ProviderId(), touched.size());
    } else {
        core::Logger::Debug("[TypeRegistry] Registered {} (provider '{}')",
                            id.QualifiedName(), definition->ProviderId());
    }
}

void TypeRegistry::RegisterTypes(const std::vector<DefinitionPtr>& definitions, std::string_view providerId) {
    if (definitions.empty()) {
        return;
    }

    std::lock_guard lock(m_writeMutex);
    EnsureNotClosed("register types");
    const bool sealed = IsSealed();

    // Collapse identical duplicates inside the batch, reject conflicting ones.
    std::vector<DefinitionPtr> batch;
    std::unordered_map<TypeId, DefinitionPtr, TypeIdHash> seen;
    for (const auto& raw : definitions) {
        if (!raw) {
            throw core::RegistrationError("<null>", "definition must not be null");
        }
        auto definition = AttributeToProvider(raw, providerId);
        auto [it, inserted] = seen.emplace(definition->Id(), definition);
        if (!inserted) {
            if (!it->second->SameContract(*definition)) {
                throw core::DuplicateTypeError(definition->QualifiedName(),
                                               it->second->ProviderId(),
                                               definition->ProviderId());
            }
            continue;
        }
        batch.push_back(std::move(definition));
    }

    const auto ordered = OrderParentsFirst(batch);

    auto working = std::make_shared<Catalog>(*m_catalog.load(std::memory_order_acquire));
    std::vector<TypeId> added;
    std::vector<TypeId> replaced;
    for (const auto& definition : ordered) {
        const bool existed = working->definitions.contains(definition->Id());
        if (Stage(*working, definition, !sealed)) {
            (existed ? replaced : added).push_back(definition->Id());
        }
    }

    if (added.empty() && replaced.empty()) {
        core::Logger::Debug("[TypeRegistry] Batch of {} definition(s) changed nothing", definitions.size());
        return;
    }

    RebuildSubTypeIndex(*working);
    std::vector<TypeId> touched = added;
    for (const auto& id : replaced) {
        auto descendants = CollectDescendants(*working, id);
        touched.insert(touched.end(), descendants.begin(), descendants.end());
    }
    std::sort(touched.begin(), touched.end());
    touched.erase(std::unique(touched.begin(), touched.end()), touched.end());

    if (sealed) {
        core::Logger::Warning("[TypeRegistry] Registering {} type(s) after seal", added.size());
    }
    Publish(std::move(working), touched);

    core::Logger::Info("[TypeRegistry] Registered {} new and replaced {} type(s){}",
                       added.size(), replaced.size(),
                       providerId.empty() ? std::string() : fmt::format(" from provider '{}'", providerId));
}

bool TypeRegistry::Stage(Catalog& working, const DefinitionPtr& definition, bool replacementAllowed) const {
    const TypeId& id = definition->Id();
    const std::string qualifiedName = id.QualifiedName();

    auto existing = working.definitions.find(id);
    if (existing != working.definitions.end()) {
        if (existing->second->SameContract(*definition)) {
            return false;
        }
        if (!replacementAllowed || existing->second->ProviderId() != definition->ProviderId()) {
            throw core::DuplicateTypeError(qualifiedName, existing->second->ProviderId(), definition->ProviderId());
        }
    }

    if (definition->HasParent()) {
        const TypeId& parent = *definition->Parent();
        if (!working.definitions.contains(parent)) {
            throw core::UnknownParentError(qualifiedName, parent.QualifiedName());
        }

        // Walk the parent chain as it would be after staging.
        std::vector<std::string> path{qualifiedName};
        std::set<TypeId> visited{id};
        TypeId cursor = parent;
        while (true) {
            path.push_back(cursor.QualifiedName());
            if (cursor == id) {
                throw core::CircularReferenceError(std::move(path));
            }
            if (!visited.insert(cursor).second) {
                break;
            }
            auto it = working.definitions.find(cursor);
            if (it == working.definitions.end() || !it->second->HasParent()) {
                break;
            }
            cursor = *it->second->Parent();
        }
    }

    working.definitions[id] = definition;
    if (!definition->ProviderId().empty()) {
        working.providers.insert(definition->ProviderId());
    }
    return true;
}

std::vector<TypeRegistry::DefinitionPtr> TypeRegistry::OrderParentsFirst(const std::vector<DefinitionPtr>& batch) {
    std::unordered_map<TypeId, DefinitionPtr, TypeIdHash> byId;
    for (const auto& definition : batch) {
        byId.emplace(definition->Id(), definition);
    }

    std::vector<DefinitionPtr> ordered;
    ordered.reserve(batch.size());
    std::set<TypeId> visited;
    std::set<TypeId> visiting;
    std::vector<TypeId> stack;

    std::function<void(const DefinitionPtr&)> visit = [&](const DefinitionPtr& definition) {
        const TypeId& id = definition->Id();
        if (visited.contains(id)) {
            return;
        }
        if (visiting.contains(id)) {
            std::vector<std::string> cycle;
            auto start = std::find(stack.begin(), stack.end(), id);
            for (auto it = start; it != stack.end(); ++it) {
                cycle.push_back(it->QualifiedName());
            }
            cycle.push_back(id.QualifiedName());
            throw core::CircularReferenceError(std::move(cycle));
        }

        visiting.insert(id);
        stack.push_back(id);
        if (definition->HasParent()) {
            auto parent = byId.find(*definition->Parent());
            if (parent != byId.end()) {
                visit(parent->second);
            }
        }
        stack.pop_back();
        visiting.erase(id);
        visited.insert(id);
        ordered.push_back(definition);
    };

    for (const auto& definition : batch) {
        visit(definition);
    }
    return ordered;
}

void TypeRegistry::RebuildSubTypeIndex(Catalog& catalog) {
    catalog.subTypesOf.clear();
    for (const auto& [id, definition] : catalog.definitions) {
        if (definition->HasParent()) {
            catalog.subTypesOf[*definition->Parent()].push_back(id);
        }
    }
    for (auto& [parent, children] : catalog.subTypesOf) {
        std::sort(children.begin(), children.end());
    }
}

std::vector<TypeId> TypeRegistry::CollectDescendants(const Catalog& catalog, const TypeId& root) {
    std::vector<TypeId> result;
    std::set<TypeId> seen{root};
    std::deque<TypeId> queue{root};
    while (!queue.empty()) {
        TypeId current = queue.front();
        queue.pop_front();
        result.push_back(current);
        auto it = catalog.subTypesOf.find(current);
        if (it == catalog.subTypesOf.end()) {
            continue;
        }
        for (const auto& child : it->second) {
            if (seen.insert(child).second) {
                queue.push_back(child);
            }
        }
    }
    return result;
}

void TypeRegistry::Publish(std::shared_ptr<const Catalog> next, const std::vector<TypeId>& touched) {
    std::unique_lock viewLock(m_viewMutex);
    m_catalog.store(std::move(next), std::memory_order_release);
    for (const auto& id : touched) {
        m_requirementCache.Invalidate(id);
        m_constraintCache.Invalidate(id);
    }
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

void TypeRegistry::EnsureNotClosed(std::string_view operation) const {
    if (Phase() == RegistryPhase::Closed) {
        throw core::StateError(operation, ToString(RegistryPhase::Closed), "TypeRegistry");
    }
}

std::shared_ptr<const TypeRegistry::Catalog> TypeRegistry::Snapshot(std::string_view operation) const {
    EnsureNotClosed(operation);
    return m_catalog.load(std::memory_order_acquire);
}

TypeRegistry::DefinitionPtr TypeRegistry::RequireDefinition(const Catalog& catalog,
                                                            std::string_view type,
                                                            std::string_view subType) const {
    auto it = catalog.definitions.find(TypeId(type, subType));
    if (it != catalog.definitions.end()) {
        return it->second;
    }

    const std::string category = NormalizeTypeName(type);
    std::vector<std::string> alternatives;
    for (const auto& [id, definition] : catalog.definitions) {
        if (id.type == category) {
            alternatives.push_back(id.QualifiedName());
        }
    }
    std::sort(alternatives.begin(), alternatives.end());
    throw core::NotFoundError("Type", fmt::format("{}.{}", type, subType), {}, std::move(alternatives));
}

TypeRegistry::DefinitionPtr TypeRegistry::GetTypeDefinition(std::string_view type, std::string_view subType) const {
    auto catalog = Snapshot("get type definition");
    return RequireDefinition(*catalog, type, subType);
}

TypeRegistry::DefinitionPtr TypeRegistry::FindTypeDefinition(std::string_view type, std::string_view subType) const {
    auto catalog = Snapshot("find type definition");
    auto it = catalog->definitions.find(TypeId(type, subType));
    return it != catalog->definitions.end() ? it->second : nullptr;
}

bool TypeRegistry::IsRegistered(std::string_view type, std::string_view subType) const {
    return FindTypeDefinition(type, subType) != nullptr;
}

bool TypeRegistry::HasType(std::string_view type) const {
    auto catalog = Snapshot("query type");
    const std::string category = NormalizeTypeName(type);
    return std::any_of(catalog->definitions.begin(), catalog->definitions.end(),
                       [&](const auto& entry) { return entry.first.type == category; });
}

std::vector<std::string> TypeRegistry::GetSubTypes(std::string_view type) const {
    auto catalog = Snapshot("query subtypes");
    const std::string category = NormalizeTypeName(type);
    std::vector<std::string> subTypes;
    for (const auto& [id, definition] : catalog->definitions) {
        if (id.type == category) {
            subTypes.push_back(id.subType);
        }
    }
    std::sort(subTypes.begin(), subTypes.end());
    return subTypes;
}

// ---------------------------------------------------------------------------
// Inheritance views
// ---------------------------------------------------------------------------

std::vector<TypeRegistry::DefinitionPtr> TypeRegistry::ChainOf(const Catalog& catalog, const TypeId& id) {
    std::vector<DefinitionPtr> chain;
    std::set<TypeId> visited;
    auto it = catalog.definitions.find(id);
    while (it != catalog.definitions.end() && visited.insert(it->first).second) {
        chain.push_back(it->second);
        if (!it->second->HasParent()) {
            break;
        }
        it = catalog.definitions.find(*it->second->Parent());
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

std::shared_ptr<const TypeRegistry::RequirementMap> TypeRegistry::ResolveRequirements(const Catalog& catalog,
                                                                                     const TypeId& id) const {
    RequirementMap merged;
    for (const auto& definition : ChainOf(catalog, id)) {
        for (const auto& requirement : definition->ChildRequirements()) {
            merged.insert_or_assign(requirement.Key(), constraint::PlacementConstraint(definition->Id(), requirement));
        }
    }
    return std::make_shared<const RequirementMap>(std::move(merged));
}

std::shared_ptr<const TypeRegistry::ConstraintMap> TypeRegistry::ResolveConstraints(const Catalog& catalog,
                                                                                   const TypeId& id) const {
    ConstraintMap merged;
    for (const auto& definition : ChainOf(catalog, id)) {
        for (const auto& [name, attributeConstraint] : definition->Constraints()) {
            merged.insert_or_assign(name, attributeConstraint);
        }
    }
    return std::make_shared<const ConstraintMap>(std::move(merged));
}

std::shared_ptr<const TypeRegistry::RequirementMap> TypeRegistry::GetInheritedChildRequirements(
    std::string_view type, std::string_view subType) const {
    std::shared_lock viewLock(m_viewMutex, std::defer_lock);
    if (Phase() == RegistryPhase::Open) {
        viewLock.lock();
    }
    auto catalog = Snapshot("query child requirements");
    const auto definition = RequireDefinition(*catalog, type, subType);
    const TypeId& id = definition->Id();
    return m_requirementCache.GetOrCompute(id, [&] { return ResolveRequirements(*catalog, id); });
}

std::vector<ChildRequirement> TypeRegistry::GetDirectChildRequirements(std::string_view type,
                                                                       std::string_view subType) const {
    return GetTypeDefinition(type, subType)->ChildRequirements();
}

std::shared_ptr<const TypeRegistry::ConstraintMap> TypeRegistry::GetInheritedConstraints(
    std::string_view type, std::string_view subType) const {
    std::shared_lock viewLock(m_viewMutex, std::defer_lock);
    if (Phase() == RegistryPhase::Open) {
        viewLock.lock();
    }
    auto catalog = Snapshot("query constraints");
    const auto definition = RequireDefinition(*catalog, type, subType);
    const TypeId& id = definition->Id();
    return m_constraintCache.GetOrCompute(id, [&] { return ResolveConstraints(*catalog, id); });
}

std::vector<TypeRegistry::DefinitionPtr> TypeRegistry::GetInheritanceChain(std::string_view type,
                                                                           std::string_view subType) const {
    auto catalog = Snapshot("query inheritance chain");
    const auto definition = RequireDefinition(*catalog, type, subType);
    return ChainOf(*catalog, definition->Id());
}

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

std::optional<constraint::PlacementConstraint> TypeRegistry::MatchPlacement(std::string_view parentType,
                                                                            std::string_view parentSubType,
                                                                            std::string_view childType,
                                                                            std::string_view childSubType,
                                                                            std::string_view childName) const {
    if (!IsRegistered(parentType, parentSubType)) {
        return std::nullopt;
    }
    const auto requirements = GetInheritedChildRequirements(parentType, parentSubType);

    // Literal requirements for this name are tried first; an unsatisfied one
    // falls through to the wildcards.
    auto literal = requirements->find(std::string(childName));
    if (literal != requirements->end() && literal->second.IsLiteral() &&
        literal->second.Permits(childType, childSubType, childName)) {
        return literal->second;
    }

    for (const auto& [key, placement] : *requirements) {
        if (!placement.IsLiteral() && placement.Permits(childType, childSubType, childName)) {
            return placement;
        }
    }
    return std::nullopt;
}

bool TypeRegistry::AcceptsChild(std::string_view parentType,
                                std::string_view parentSubType,
                                std::string_view childType,
                                std::string_view childSubType,
                                std::string_view childName) const {
    return MatchPlacement(parentType, parentSubType, childType, childSubType, childName).has_value();
}

std::optional<constraint::PlacementConstraint> TypeRegistry::FindChildRequirement(std::string_view parentType,
                                                                                  std::string_view parentSubType,
                                                                                  std::string_view childName) const {
    if (!IsRegistered(parentType, parentSubType)) {
        return std::nullopt;
    }
    const auto requirements = GetInheritedChildRequirements(parentType, parentSubType);
    auto it = requirements->find(std::string(childName));
    if (it == requirements->end() || !it->second.IsLiteral()) {
        return std::nullopt;
    }
    return it->second;
}

std::string TypeRegistry::GetSupportedChildrenDescription(std::string_view type, std::string_view subType) const {
    const auto requirements = GetInheritedChildRequirements(type, subType);
    if (requirements->empty()) {
        return "Supports: no children";
    }
    std::string description = "Supports: ";
    bool first = true;
    for (const auto& [key, placement] : *requirements) {
        if (!first) {
            description += ", ";
        }
        description += placement.Describe();
        first = false;
    }
    return description;
}

// ---------------------------------------------------------------------------
// Snapshots and diagnostics
// ---------------------------------------------------------------------------

std::vector<TypeRegistry::DefinitionPtr> TypeRegistry::GetAllTypeDefinitions() const {
    auto catalog = Snapshot("list type definitions");
    std::vector<DefinitionPtr> definitions;
    definitions.reserve(catalog->definitions.size());
    for (const auto& [id, definition] : catalog->definitions) {
        definitions.push_back(definition);
    }
    std::sort(definitions.begin(), definitions.end(),
              [](const DefinitionPtr& a, const DefinitionPtr& b) { return a->Id() < b->Id(); });
    return definitions;
}

std::vector<std::string> TypeRegistry::GetRegisteredTypeNames() const {
    std::vector<std::string> names;
    for (const auto& definition : GetAllTypeDefinitions()) {
        names.push_back(definition->QualifiedName());
    }
    return names;
}

TypeRegistry::Stats TypeRegistry::GetStats() const {
    auto catalog = Snapshot("collect statistics");
    Stats stats;
    stats.phase = Phase();
    stats.typeCount = catalog->definitions.size();
    stats.providerCount = catalog->providers.size();
    for (const auto& [id, definition] : catalog->definitions) {
        ++stats.typesPerCategory[id.type];
        stats.childRequirementCount += definition->ChildRequirements().size();
        stats.constraintCount += definition->Constraints().size();
    }
    stats.requirementCache = m_requirementCache.GetStats();
    stats.constraintCache = m_constraintCache.GetStats();
    return stats;
}

nlohmann::json TypeRegistry::ToJson(const Stats& stats) {
    nlohmann::json categories = nlohmann::json::object();
    for (const auto& [category, count] : stats.typesPerCategory) {
        categories[category] = count;
    }
    return {
        {"phase", std::string(ToString(stats.phase))},
        {"typeCount", stats.typeCount},
        {"typesPerCategory", categories},
        {"childRequirementCount", stats.childRequirementCount},
        {"constraintCount", stats.constraintCount},
        {"providerCount", stats.providerCount},
        {"requirementCache", CacheStatsToJson(stats.requirementCache)},
        {"constraintCache", CacheStatsToJson(stats.constraintCache)}
    };
}

RegistryHealthReport TypeRegistry::ValidateConsistency() const {
    auto report = RegistryHealthReport::Analyze(GetAllTypeDefinitions());
    if (report.IsHealthy()) {
        core::Logger::Info("[TypeRegistry] {}", report.Summary());
    } else {
        core::Logger::Warning("[TypeRegistry] {}", report.Summary());
    }
    return report;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void TypeRegistry::Seal() {
    std::lock_guard lock(m_writeMutex);
    EnsureNotClosed("seal");
    if (IsSealed()) {
        core::Logger::Debug("[TypeRegistry] Already sealed");
        return;
    }

    std::unique_lock viewLock(m_viewMutex);
    auto catalog = m_catalog.load(std::memory_order_acquire);
    for (const auto& [id, definition] : catalog->definitions) {
        m_requirementCache.PutPermanent(id, ResolveRequirements(*catalog, id));
        m_constraintCache.PutPermanent(id, ResolveConstraints(*catalog, id));
    }
    m_requirementCache.Freeze();
    m_constraintCache.Freeze();
    m_phase.store(RegistryPhase::Sealed, std::memory_order_release);

    core::Logger::Info("[TypeRegistry] Sealed with {} type(s) from {} provider(s)",
                       catalog->definitions.size(), catalog->providers.size());
}

void TypeRegistry::Close() {
    std::lock_guard lock(m_writeMutex);
    if (Phase() == RegistryPhase::Closed) {
        return;
    }
    std::unique_lock viewLock(m_viewMutex);
    m_phase.store(RegistryPhase::Closed, std::memory_order_release);
    m_catalog.store(std::make_shared<const Catalog>(), std::memory_order_release);
    m_requirementCache.Clear();
    m_constraintCache.Clear();
    core::Logger::Info("[TypeRegistry] Closed");
}

} // namespace mo::registry
