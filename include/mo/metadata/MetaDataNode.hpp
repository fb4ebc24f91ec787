#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "mo/cache/DualCache.hpp"
#include "mo/registry/TypeId.hpp"

namespace mo::constraint {
class ConstraintEngine;
}

namespace mo::metadata {

class MetaAttribute;

inline constexpr std::string_view kPackageSeparator = "::";

enum class NodeState {
    Uninitialized,
    UnderConstruction,
    Sealed,
    Destroyed
};

std::string_view ToString(NodeState state);

/**
 * @brief One node of the metadata tree: an object, field, attribute, validator, ...
 *
 * A node owns its children. The parent and super-node links are non-owning;
 * the super node supplies inherited children. Type, subtype and name never
 * change after construction.
 *
 * Every AddChild goes through the ConstraintEngine before the child is linked.
 * Derived child lists are cached per node and invalidated for the node, its
 * ancestors and the nodes that use it as super node.
 *
 * Mutation is synchronized per node while loading. Sealed nodes reject
 * mutation and are read without taking the node lock.
 */
class MetaDataNode {
public:
    using NodeList = std::vector<const MetaDataNode*>;
    using NodeListPtr = std::shared_ptr<const NodeList>;

    MetaDataNode(const constraint::ConstraintEngine& engine,
                 std::string_view type,
                 std::string_view subType,
                 std::string name);
    virtual ~MetaDataNode();

    MetaDataNode(const MetaDataNode&) = delete;
    MetaDataNode& operator=(const MetaDataNode&) = delete;

    /// Creates a node after checking that (type, subType) is registered.
    static std::unique_ptr<MetaDataNode> Create(const constraint::ConstraintEngine& engine,
                                                std::string_view type,
                                                std::string_view subType,
                                                std::string name);

    // Identity ----------------------------------------------------------------
    [[nodiscard]] const std::string& Type() const { return m_id.type; }
    [[nodiscard]] const std::string& SubType() const { return m_id.subType; }
    [[nodiscard]] const registry::TypeId& Id() const { return m_id; }
    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] std::string ShortName() const;
    [[nodiscard]] std::string Package() const;
    [[nodiscard]] virtual bool IsAttribute() const { return false; }

    [[nodiscard]] MetaDataNode* Parent() const { return m_parent; }
    [[nodiscard]] const MetaDataNode* SuperNode() const { return m_superNode; }
    [[nodiscard]] const constraint::ConstraintEngine& Engine() const { return *m_engine; }

    // Structure ---------------------------------------------------------------
    MetaDataNode& AddChild(std::unique_ptr<MetaDataNode> child);
    std::unique_ptr<MetaDataNode> RemoveChild(std::string_view type, std::string_view name);

    /// Own children in insertion order.
    [[nodiscard]] NodeListPtr GetChildren() const;
    /// Own children, then inherited ones from the super chain when includeSuper is set.
    [[nodiscard]] NodeListPtr GetAllChildren(bool includeSuper) const;
    [[nodiscard]] NodeListPtr GetChildrenOfType(std::string_view type, bool includeSuper = false) const;

    /// Empty type matches any type. Searches the super chain when includeSuper is set.
    [[nodiscard]] const MetaDataNode* FindChild(std::string_view name,
                                                std::string_view type = {},
                                                bool includeSuper = true) const;
    const MetaDataNode& RequireChild(std::string_view name, std::string_view type = {}) const;

    // Attributes --------------------------------------------------------------
    [[nodiscard]] bool HasAttribute(std::string_view name, bool includeSuper = true) const;
    [[nodiscard]] const MetaAttribute* FindAttribute(std::string_view name, bool includeSuper = true) const;
    [[nodiscard]] std::optional<nlohmann::json> GetAttribute(std::string_view name) const;
    nlohmann::json RequireAttribute(std::string_view name) const;

    template <typename T>
    [[nodiscard]] std::optional<T> GetAttributeAs(std::string_view name) const {
        auto value = GetAttribute(name);
        if (!value) {
            return std::nullopt;
        }
        try {
            return value->get<T>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    /// Validates the value, then updates the existing attribute or adds a new one.
    MetaAttribute& SetAttribute(std::string name, nlohmann::json value);

    /// Field children, own and inherited, whose "required" attribute is true.
    [[nodiscard]] NodeListPtr GetRequiredFields() const;

    // Inheritance and copies --------------------------------------------------
    void SetSuperNode(const MetaDataNode* superNode);

    /// Deep copy of the subtree. Super references inside the subtree point to the copies.
    [[nodiscard]] std::unique_ptr<MetaDataNode> Clone() const;
    /// Childless copy whose super node is this node.
    [[nodiscard]] std::unique_ptr<MetaDataNode> Overload() const;

    // Diagnostics -------------------------------------------------------------
    /// "object:User → field:email → validator:required"
    [[nodiscard]] std::string Path() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] cache::CacheStats GetCacheStats() const { return m_cache.GetStats(); }

    // Lifecycle ---------------------------------------------------------------
    void Seal();
    virtual void Destroy();
    [[nodiscard]] NodeState State() const { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] bool IsSealed() const { return State() == NodeState::Sealed; }

protected:
    /// Copy of this node's own data: no children, no parent, no super node.
    virtual std::unique_ptr<MetaDataNode> CloneSelf() const;

    void EnsureMutable(std::string_view operation) const;
    void MarkUnderConstruction();
    void InvalidateDerived() const;
    std::shared_lock<std::shared_mutex> ReadLock() const;

    mutable std::shared_mutex m_mutex;

private:
    friend class MetaAttribute;

    using NodeCache = cache::DualCache<std::string, NodeListPtr>;

    // The *Locked helpers expect the caller to hold ReadLock() or the unique lock.
    NodeListPtr AllChildrenLocked(bool includeSuper) const;
    NodeListPtr ChildrenOfTypeLocked(const std::string& type, bool includeSuper) const;
    const MetaDataNode* FindOwnChildLocked(std::string_view name, std::string_view type) const;

    void ValidateAttachedAttribute(const MetaAttribute& attribute) const;
    void InvalidateDerived(std::unordered_set<const MetaDataNode*>& visited) const;
    void ClearCache() const;
    void AddDependent(MetaDataNode* dependent) const;
    void RemoveDependent(const MetaDataNode* dependent) const;
    std::unique_ptr<MetaDataNode> CloneTree(std::unordered_map<const MetaDataNode*, MetaDataNode*>& mapping) const;

    const constraint::ConstraintEngine* m_engine;
    registry::TypeId m_id;
    std::string m_name;

    MetaDataNode* m_parent = nullptr;
    const MetaDataNode* m_superNode = nullptr;

    // Nodes whose super node is this one.
    mutable std::mutex m_dependentsMutex;
    mutable std::vector<MetaDataNode*> m_dependents;

    std::atomic<NodeState> m_state{NodeState::Uninitialized};
    mutable NodeCache m_cache;

    // Declared last so children are destroyed while this node is still intact.
    std::vector<std::unique_ptr<MetaDataNode>> m_children;
};

} // namespace mo::metadata
