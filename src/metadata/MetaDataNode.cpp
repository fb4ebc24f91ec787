#include "mo/metadata/MetaDataNode.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "mo/constraint/ConstraintEngine.hpp"
#include "mo/core/Error.hpp"
#include "mo/core/Logger.hpp"
#include "mo/metadata/MetaAttribute.hpp"
#include "mo/registry/TypeRegistry.hpp"

namespace mo::metadata {

namespace {

constexpr std::string_view kPathSeparator = " → ";

cache::DualCache<std::string, MetaDataNode::NodeListPtr>::Options NodeCacheOptions(
    const constraint::ConstraintEngine& engine) {
    const auto& config = engine.Registry().GetCacheConfig();
    return {config.computedCapacity, config.promotionThreshold};
}

bool SameShape(const MetaDataNode& a, const MetaDataNode& b) {
    return a.Type() == b.Type() && a.Name() == b.Name();
}

bool IsLocalAttribute(const MetaDataNode& node) {
    return node.IsAttribute() && !static_cast<const MetaAttribute&>(node).IsInheritable();
}

MetaDataNode::NodeListPtr MakeList(MetaDataNode::NodeList list) {
    return std::make_shared<const MetaDataNode::NodeList>(std::move(list));
}

} // namespace

std::string_view ToString(NodeState state) {
    switch (state) {
        case NodeState::Uninitialized:     return "Uninitialized";
        case NodeState::UnderConstruction: return "UnderConstruction";
        case NodeState::Sealed:            return "Sealed";
        case NodeState::Destroyed:         return "Destroyed";
    }
    return "Unknown";
}

MetaDataNode::MetaDataNode(const constraint::ConstraintEngine& engine,
                           std::string_view type,
                           std::string_view subType,
                           std::string name)
    : m_engine(&engine),
      m_id(type, subType),
      m_name(std::move(name)),
      m_cache(NodeCacheOptions(engine)) {}

MetaDataNode::~MetaDataNode() {
    if (m_superNode) {
        m_superNode->RemoveDependent(this);
    }
    std::vector<MetaDataNode*> dependents;
    {
        std::lock_guard lock(m_dependentsMutex);
        dependents.swap(m_dependents);
    }
    // Dependents of dependents cache lists built through this node as well.
    for (MetaDataNode* dependent : dependents) {
        dependent->m_superNode = nullptr;
        dependent->InvalidateDerived();
    }
}

std::unique_ptr<MetaDataNode> MetaDataNode::Create(const constraint::ConstraintEngine& engine,
                                                   std::string_view type,
                                                   std::string_view subType,
                                                   std::string name) {
    const auto definition = engine.Registry().GetTypeDefinition(type, subType);
    return std::make_unique<MetaDataNode>(engine, definition->Type(), definition->SubType(), std::move(name));
}

std::string MetaDataNode::ShortName() const {
    const auto pos = m_name.rfind(kPackageSeparator);
    return pos == std::string::npos ? m_name : m_name.substr(pos + kPackageSeparator.size());
}

std::string MetaDataNode::Package() const {
    const auto pos = m_name.rfind(kPackageSeparator);
    return pos == std::string::npos ? std::string() : m_name.substr(0, pos);
}

// ---------------------------------------------------------------------------
// Locking and state
// ---------------------------------------------------------------------------

std::shared_lock<std::shared_mutex> MetaDataNode::ReadLock() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex, std::defer_lock);
    if (!IsSealed()) {
        lock.lock();
    }
    return lock;
}

void MetaDataNode::EnsureMutable(std::string_view operation) const {
    const NodeState state = State();
    if (state == NodeState::Sealed || state == NodeState::Destroyed) {
        throw core::StateError(operation, metadata::ToString(state), Path());
    }
}

void MetaDataNode::MarkUnderConstruction() {
    NodeState expected = NodeState::Uninitialized;
    m_state.compare_exchange_strong(expected, NodeState::UnderConstruction, std::memory_order_acq_rel);
}

void MetaDataNode::ClearCache() const {
    std::unique_lock lock(m_mutex);
    m_cache.Clear();
    if (IsSealed()) {
        m_cache.Freeze();
    }
}

void MetaDataNode::InvalidateDerived() const {
    std::unordered_set<const MetaDataNode*> visited;
    InvalidateDerived(visited);
}

void MetaDataNode::InvalidateDerived(std::unordered_set<const MetaDataNode*>& visited) const {
    if (!visited.insert(this).second) {
        return;
    }
    ClearCache();

    if (m_parent) {
        m_parent->InvalidateDerived(visited);
    }

    std::vector<MetaDataNode*> dependents;
    {
        std::lock_guard lock(m_dependentsMutex);
        dependents = m_dependents;
    }
    for (const MetaDataNode* dependent : dependents) {
        dependent->InvalidateDerived(visited);
    }
}

void MetaDataNode::AddDependent(MetaDataNode* dependent) const {
    std::lock_guard lock(m_dependentsMutex);
    m_dependents.push_back(dependent);
}

void MetaDataNode::RemoveDependent(const MetaDataNode* dependent) const {
    std::lock_guard lock(m_dependentsMutex);
    m_dependents.erase(std::remove(m_dependents.begin(), m_dependents.end(), dependent), m_dependents.end());
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

MetaDataNode& MetaDataNode::AddChild(std::unique_ptr<MetaDataNode> child) {
    if (!child) {
        throw core::StructureError(Path(), "child must not be null");
    }
    EnsureMutable("add child");
    if (IsAttribute()) {
        throw core::StructureError(Path(), "attributes cannot have children");
    }
    if (child->m_parent) {
        throw core::StructureError(Path(), fmt::format("{} already has a parent", child->Path()));
    }
    for (const MetaDataNode* ancestor = this; ancestor; ancestor = ancestor->m_parent) {
        if (ancestor == child.get()) {
            throw core::StructureError(Path(), "a node cannot be added below itself");
        }
    }
    const NodeState childState = child->State();
    if (childState == NodeState::Sealed || childState == NodeState::Destroyed) {
        throw core::StateError("attach node", metadata::ToString(childState), child->Path());
    }
    if (const auto* attribute = dynamic_cast<const MetaAttribute*>(child.get())) {
        ValidateAttachedAttribute(*attribute);
    }

    MetaDataNode* linked = child.get();
    std::unique_ptr<MetaDataNode> replaced;
    {
        std::unique_lock lock(m_mutex);
        EnsureMutable("add child");

        auto existing = std::find_if(m_children.begin(), m_children.end(),
                                     [&](const auto& current) { return SameShape(*current, *linked); });
        if (existing != m_children.end() && !linked->IsAttribute()) {
            throw core::DuplicateChildNameError(Path(), linked->Type(), linked->Name());
        }

        m_engine->ValidatePlacement(*this, *linked);

        linked->m_parent = this;
        linked->MarkUnderConstruction();
        if (existing != m_children.end()) {
            (*existing)->m_parent = nullptr;
            replaced = std::move(*existing);
            *existing = std::move(child);
        } else {
            m_children.push_back(std::move(child));
        }
        MarkUnderConstruction();
    }
    InvalidateDerived();

    if (replaced) {
        core::Logger::Debug("[MetaDataNode] Replaced attribute '{}' on {}", linked->Name(), Path());
    } else {
        core::Logger::Debug("[MetaDataNode] Added {}:{}({}) to {}", linked->Type(), linked->SubType(),
                            linked->Name(), Path());
    }
    return *linked;
}

// Attributes attached directly must satisfy the same rules as SetAttribute.
void MetaDataNode::ValidateAttachedAttribute(const MetaAttribute& attribute) const {
    const nlohmann::json value = attribute.Value();
    m_engine->ValidateAttributeValue(*this, attribute.Name(), value);
    const std::string expected = m_engine->ResolveAttributeSubType(*this, attribute.Name(), value);
    if (attribute.SubType() != expected) {
        throw core::ValueConstraintViolationError(
            Path(), attribute.Name(), "kind", value.dump(),
            fmt::format("attribute subtype {} does not match declared {}", attribute.SubType(), expected));
    }
}

std::unique_ptr<MetaDataNode> MetaDataNode::RemoveChild(std::string_view type, std::string_view name) {
    EnsureMutable("remove child");
    const std::string normalizedType = registry::NormalizeTypeName(type);

    std::unique_ptr<MetaDataNode> removed;
    {
        std::unique_lock lock(m_mutex);
        EnsureMutable("remove child");
        auto it = std::find_if(m_children.begin(), m_children.end(), [&](const auto& child) {
            return child->Type() == normalizedType && child->Name() == name;
        });
        if (it == m_children.end()) {
            throw core::NotFoundError("Child", fmt::format("{}:{}", normalizedType, name), Path());
        }
        removed = std::move(*it);
        m_children.erase(it);
        removed->m_parent = nullptr;
        MarkUnderConstruction();
    }
    InvalidateDerived();
    return removed;
}

MetaDataNode::NodeListPtr MetaDataNode::AllChildrenLocked(bool includeSuper) const {
    return m_cache.GetOrCompute(includeSuper ? "all+super" : "all", [&] {
        NodeList own;
        own.reserve(m_children.size());
        for (const auto& child : m_children) {
            own.push_back(child.get());
        }
        if (!includeSuper || !m_superNode) {
            return MakeList(std::move(own));
        }

        NodeList merged = own;
        for (const MetaDataNode* inherited : *m_superNode->GetAllChildren(true)) {
            if (IsLocalAttribute(*inherited)) {
                continue;
            }
            const bool shadowed = std::any_of(own.begin(), own.end(), [&](const MetaDataNode* node) {
                return SameShape(*node, *inherited);
            });
            if (!shadowed) {
                merged.push_back(inherited);
            }
        }
        return MakeList(std::move(merged));
    });
}

MetaDataNode::NodeListPtr MetaDataNode::ChildrenOfTypeLocked(const std::string& type, bool includeSuper) const {
    return m_cache.GetOrCompute(fmt::format("{}:{}", includeSuper ? "super" : "own", type), [&] {
        NodeList filtered;
        for (const MetaDataNode* child : *AllChildrenLocked(includeSuper)) {
            if (child->Type() == type) {
                filtered.push_back(child);
            }
        }
        return MakeList(std::move(filtered));
    });
}

MetaDataNode::NodeListPtr MetaDataNode::GetChildren() const {
    auto lock = ReadLock();
    return AllChildrenLocked(false);
}

MetaDataNode::NodeListPtr MetaDataNode::GetAllChildren(bool includeSuper) const {
    auto lock = ReadLock();
    return AllChildrenLocked(includeSuper);
}

MetaDataNode::NodeListPtr MetaDataNode::GetChildrenOfType(std::string_view type, bool includeSuper) const {
    auto lock = ReadLock();
    return ChildrenOfTypeLocked(registry::NormalizeTypeName(type), includeSuper);
}

const MetaDataNode* MetaDataNode::FindOwnChildLocked(std::string_view name, std::string_view type) const {
    const std::string normalizedType = registry::NormalizeTypeName(type);
    for (const auto& child : m_children) {
        if (child->Name() == name && (normalizedType.empty() || child->Type() == normalizedType)) {
            return child.get();
        }
    }
    return nullptr;
}

const MetaDataNode* MetaDataNode::FindChild(std::string_view name, std::string_view type, bool includeSuper) const {
    auto lock = ReadLock();
    if (const MetaDataNode* own = FindOwnChildLocked(name, type)) {
        return own;
    }
    if (!includeSuper || !m_superNode) {
        return nullptr;
    }
    const MetaDataNode* inherited = m_superNode->FindChild(name, type, true);
    if (inherited && IsLocalAttribute(*inherited)) {
        return nullptr;
    }
    return inherited;
}

const MetaDataNode& MetaDataNode::RequireChild(std::string_view name, std::string_view type) const {
    if (const MetaDataNode* child = FindChild(name, type, true)) {
        return *child;
    }

    std::vector<std::string> alternatives;
    for (const MetaDataNode* child : *GetAllChildren(true)) {
        if (type.empty() || child->Type() == registry::NormalizeTypeName(type)) {
            alternatives.push_back(fmt::format("{}:{}", child->Type(), child->Name()));
        }
    }
    const std::string requested = type.empty() ? std::string(name)
                                               : fmt::format("{}:{}", registry::NormalizeTypeName(type), name);
    throw core::NotFoundError("Child", std::string(name), fmt::format("{}{}{}", Path(), kPathSeparator, requested),
                              std::move(alternatives));
}

// ---------------------------------------------------------------------------
// Attributes
// ---------------------------------------------------------------------------

const MetaAttribute* MetaDataNode::FindAttribute(std::string_view name, bool includeSuper) const {
    return static_cast<const MetaAttribute*>(FindChild(name, MetaAttribute::kType, includeSuper));
}

bool MetaDataNode::HasAttribute(std::string_view name, bool includeSuper) const {
    return FindAttribute(name, includeSuper) != nullptr;
}

std::optional<nlohmann::json> MetaDataNode::GetAttribute(std::string_view name) const {
    if (const MetaAttribute* attribute = FindAttribute(name, true)) {
        return attribute->Value();
    }
    return std::nullopt;
}

nlohmann::json MetaDataNode::RequireAttribute(std::string_view name) const {
    if (const MetaAttribute* attribute = FindAttribute(name, true)) {
        return attribute->Value();
    }
    std::vector<std::string> alternatives;
    for (const MetaDataNode* child : *GetChildrenOfType(MetaAttribute::kType, true)) {
        alternatives.push_back(child->Name());
    }
    throw core::NotFoundError("Attribute", std::string(name), Path(), std::move(alternatives));
}

MetaAttribute& MetaDataNode::SetAttribute(std::string name, nlohmann::json value) {
    EnsureMutable("set attribute");
    m_engine->ValidateAttributeValue(*this, name, value);
    const std::string subType = m_engine->ResolveAttributeSubType(*this, name, value);

    MetaAttribute* updated = nullptr;
    {
        std::unique_lock lock(m_mutex);
        EnsureMutable("set attribute");
        auto* existing = const_cast<MetaDataNode*>(FindOwnChildLocked(name, MetaAttribute::kType));
        if (existing && existing->SubType() == subType) {
            updated = static_cast<MetaAttribute*>(existing);
            updated->AssignValue(std::move(value));
            MarkUnderConstruction();
        }
    }
    if (updated) {
        InvalidateDerived();
        return *updated;
    }

    auto attribute = std::make_unique<MetaAttribute>(*m_engine, subType, std::move(name), std::move(value));
    return static_cast<MetaAttribute&>(AddChild(std::move(attribute)));
}

MetaDataNode::NodeListPtr MetaDataNode::GetRequiredFields() const {
    auto lock = ReadLock();
    return m_cache.GetOrCompute("requiredFields", [&] {
        NodeList required;
        for (const MetaDataNode* field : *ChildrenOfTypeLocked("field", true)) {
            if (field->GetAttributeAs<bool>("required").value_or(false)) {
                required.push_back(field);
            }
        }
        return MakeList(std::move(required));
    });
}

// ---------------------------------------------------------------------------
// Inheritance and copies
// ---------------------------------------------------------------------------

void MetaDataNode::SetSuperNode(const MetaDataNode* superNode) {
    EnsureMutable("set super node");
    if (superNode == m_superNode) {
        return;
    }

    if (superNode) {
        if (superNode->Type() != Type()) {
            throw core::StructureError(Path(), fmt::format("super node {} must have type '{}'",
                                                           superNode->Path(), Type()));
        }
        std::vector<std::string> cycle{Path()};
        std::unordered_set<const MetaDataNode*> visited{this};
        for (const MetaDataNode* cursor = superNode; cursor; cursor = cursor->m_superNode) {
            cycle.push_back(cursor->Path());
            if (cursor == this) {
                throw core::SuperNodeCycleError(std::move(cycle));
            }
            if (!visited.insert(cursor).second) {
                break;
            }
        }
    }

    const MetaDataNode* previous = nullptr;
    {
        std::unique_lock lock(m_mutex);
        EnsureMutable("set super node");
        previous = m_superNode;
        m_superNode = superNode;
        MarkUnderConstruction();
    }
    if (previous) {
        previous->RemoveDependent(this);
    }
    if (superNode) {
        superNode->AddDependent(this);
    }
    InvalidateDerived();
}

std::unique_ptr<MetaDataNode> MetaDataNode::CloneSelf() const {
    return std::make_unique<MetaDataNode>(*m_engine, Type(), SubType(), m_name);
}

std::unique_ptr<MetaDataNode> MetaDataNode::CloneTree(
    std::unordered_map<const MetaDataNode*, MetaDataNode*>& mapping) const {
    auto copy = CloneSelf();
    mapping.emplace(this, copy.get());
    {
        auto lock = ReadLock();
        copy->m_children.reserve(m_children.size());
        for (const auto& child : m_children) {
            auto childCopy = child->CloneTree(mapping);
            childCopy->m_parent = copy.get();
            copy->m_children.push_back(std::move(childCopy));
        }
    }
    copy->m_state.store(NodeState::UnderConstruction, std::memory_order_release);
    return copy;
}

std::unique_ptr<MetaDataNode> MetaDataNode::Clone() const {
    std::unordered_map<const MetaDataNode*, MetaDataNode*> mapping;
    auto root = CloneTree(mapping);

    for (const auto& [original, copy] : mapping) {
        const MetaDataNode* superNode = original->m_superNode;
        if (!superNode) {
            continue;
        }
        auto inside = mapping.find(superNode);
        const MetaDataNode* target = inside != mapping.end() ? inside->second : superNode;
        copy->m_superNode = target;
        target->AddDependent(copy);
    }

    core::Logger::Debug("[MetaDataNode] Cloned {} ({} node(s))", Path(), mapping.size());
    return root;
}

std::unique_ptr<MetaDataNode> MetaDataNode::Overload() const {
    auto copy = CloneSelf();
    copy->SetSuperNode(this);
    return copy;
}

// ---------------------------------------------------------------------------
// Diagnostics and lifecycle
// ---------------------------------------------------------------------------

std::string MetaDataNode::Path() const {
    std::vector<const MetaDataNode*> chain;
    for (const MetaDataNode* node = this; node; node = node->m_parent) {
        chain.push_back(node);
    }
    std::string path;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!path.empty()) {
            path.append(kPathSeparator);
        }
        const MetaDataNode* node = *it;
        path.append(fmt::format("{}:{}", node->Type(), node->Name().empty() ? node->SubType() : node->Name()));
    }
    return path;
}

std::string MetaDataNode::ToString() const {
    std::string text = fmt::format("{}[{}:{}]{{{}}}", IsAttribute() ? "MetaAttribute" : "MetaDataNode",
                                   Type(), SubType(), m_name);
    if (m_parent) {
        text += fmt::format("@{}", m_parent->Name());
    }
    return text;
}

void MetaDataNode::Seal() {
    {
        std::unique_lock lock(m_mutex);
        const NodeState state = State();
        if (state == NodeState::Destroyed) {
            throw core::StateError("seal", metadata::ToString(state), Path());
        }
        m_state.store(NodeState::Sealed, std::memory_order_release);
        m_cache.Freeze();
    }
    for (const auto& child : m_children) {
        child->Seal();
    }
}

void MetaDataNode::Destroy() {
    {
        std::unique_lock lock(m_mutex);
        m_state.store(NodeState::Destroyed, std::memory_order_release);
        m_cache.Clear();
    }
    for (const auto& child : m_children) {
        child->Destroy();
    }
}

} // namespace mo::metadata
