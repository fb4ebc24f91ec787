#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "mo/core/Error.hpp"

namespace mo::cache {

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t loads = 0;
    std::size_t evictions = 0;
    std::size_t promotions = 0;
    std::size_t permanentSize = 0;
    std::size_t computedSize = 0;

    [[nodiscard]] double HitRatio() const {
        const std::size_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * @brief Two-tier cache for load-once, read-many data.
 *
 * The permanent tier is never evicted. It is published as an immutable map
 * snapshot, so lookups never take a lock; writes copy the map and are only
 * allowed until Freeze(). The computed tier is bounded with FIFO eviction and
 * guarded by a reader/writer lock. Concurrent computations of the same key keep
 * the first inserted value.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class DualCache {
public:
    struct Options {
        std::size_t computedCapacity = 256;
        std::size_t promotionThreshold = 4;
    };

    DualCache() : DualCache(Options{}) {}

    explicit DualCache(Options options)
        : m_options(options),
          m_permanent(std::make_shared<const PermanentMap>()) {
        if (m_options.computedCapacity == 0) {
            m_options.computedCapacity = 1;
        }
    }

    DualCache(const DualCache&) = delete;
    DualCache& operator=(const DualCache&) = delete;

    template <typename Fn>
    Value GetOrCompute(const Key& key, Fn&& compute) {
        if (auto permanent = FindPermanent(key)) {
            m_hits.fetch_add(1, std::memory_order_relaxed);
            return *permanent;
        }

        std::optional<Value> promoted;
        {
            std::shared_lock lock(m_computedMutex);
            auto it = m_computed.find(key);
            if (it != m_computed.end()) {
                m_hits.fetch_add(1, std::memory_order_relaxed);
                const std::size_t entryHits = it->second.hits.fetch_add(1, std::memory_order_relaxed) + 1;
                const bool promote = m_options.promotionThreshold > 0 &&
                                     entryHits >= m_options.promotionThreshold &&
                                     !m_frozen.load(std::memory_order_acquire);
                if (!promote) {
                    return it->second.value;
                }
                promoted = it->second.value;
            }
        }

        if (promoted) {
            Promote(key, *promoted);
            return std::move(*promoted);
        }

        m_misses.fetch_add(1, std::memory_order_relaxed);
        Value computed = std::forward<Fn>(compute)();
        m_loads.fetch_add(1, std::memory_order_relaxed);
        return StoreComputed(key, std::move(computed));
    }

    [[nodiscard]] std::optional<Value> Find(const Key& key) const {
        if (auto permanent = FindPermanent(key)) {
            return *permanent;
        }
        std::shared_lock lock(m_computedMutex);
        auto it = m_computed.find(key);
        if (it == m_computed.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void PutPermanent(const Key& key, Value value) {
        std::lock_guard lock(m_permanentWriteMutex);
        if (m_frozen.load(std::memory_order_acquire)) {
            throw core::StateError("write permanent cache entry", "Frozen");
        }
        auto next = std::make_shared<PermanentMap>(*m_permanent.load(std::memory_order_acquire));
        (*next)[key] = std::move(value);
        m_permanent.store(std::move(next), std::memory_order_release);
        EraseComputed(key);
    }

    /// Removes one key from both tiers. Frozen permanent entries cannot be removed.
    void Invalidate(const Key& key) {
        {
            std::lock_guard lock(m_permanentWriteMutex);
            auto current = m_permanent.load(std::memory_order_acquire);
            if (current->contains(key)) {
                if (m_frozen.load(std::memory_order_acquire)) {
                    throw core::StateError("invalidate permanent cache entry", "Frozen");
                }
                auto next = std::make_shared<PermanentMap>(*current);
                next->erase(key);
                m_permanent.store(std::move(next), std::memory_order_release);
            }
        }
        EraseComputed(key);
    }

    void ClearComputed() {
        std::unique_lock lock(m_computedMutex);
        m_computed.clear();
        m_order.clear();
    }

    /// Drops both tiers and unfreezes. Used when the owner is reset.
    void Clear() {
        {
            std::lock_guard lock(m_permanentWriteMutex);
            m_permanent.store(std::make_shared<const PermanentMap>(), std::memory_order_release);
            m_frozen.store(false, std::memory_order_release);
        }
        ClearComputed();
    }

    void Freeze() {
        std::lock_guard lock(m_permanentWriteMutex);
        m_frozen.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool IsFrozen() const { return m_frozen.load(std::memory_order_acquire); }

    [[nodiscard]] bool ContainsPermanent(const Key& key) const {
        return m_permanent.load(std::memory_order_acquire)->contains(key);
    }

    [[nodiscard]] bool ContainsComputed(const Key& key) const {
        std::shared_lock lock(m_computedMutex);
        return m_computed.contains(key);
    }

    [[nodiscard]] CacheStats GetStats() const {
        CacheStats stats;
        stats.hits = m_hits.load(std::memory_order_relaxed);
        stats.misses = m_misses.load(std::memory_order_relaxed);
        stats.loads = m_loads.load(std::memory_order_relaxed);
        stats.evictions = m_evictions.load(std::memory_order_relaxed);
        stats.promotions = m_promotions.load(std::memory_order_relaxed);
        stats.permanentSize = m_permanent.load(std::memory_order_acquire)->size();
        {
            std::shared_lock lock(m_computedMutex);
            stats.computedSize = m_computed.size();
        }
        return stats;
    }

    [[nodiscard]] const Options& GetOptions() const { return m_options; }

private:
    using PermanentMap = std::unordered_map<Key, Value, Hash>;

    struct ComputedEntry {
        explicit ComputedEntry(Value v) : value(std::move(v)) {}

        Value value;
        std::atomic<std::size_t> hits{0};
    };

    std::optional<Value> FindPermanent(const Key& key) const {
        auto snapshot = m_permanent.load(std::memory_order_acquire);
        auto it = snapshot->find(key);
        if (it == snapshot->end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Value StoreComputed(const Key& key, Value value) {
        std::unique_lock lock(m_computedMutex);
        auto [it, inserted] = m_computed.try_emplace(key, std::move(value));
        if (!inserted) {
            return it->second.value;
        }
        m_order.push_back(key);
        Value result = it->second.value;
        while (m_computed.size() > m_options.computedCapacity && !m_order.empty()) {
            const Key oldest = m_order.front();
            m_order.pop_front();
            if (m_computed.erase(oldest) > 0) {
                m_evictions.fetch_add(1, std::memory_order_relaxed);
            }
        }
        return result;
    }

    // Moves a hot computed entry into the permanent tier. A no-op when another
    // thread promoted, evicted or froze first.
    void Promote(const Key& key, const Value& value) {
        std::lock_guard permanentLock(m_permanentWriteMutex);
        if (m_frozen.load(std::memory_order_acquire)) {
            return;
        }
        std::unique_lock computedLock(m_computedMutex);
        auto it = m_computed.find(key);
        if (it == m_computed.end()) {
            return;
        }

        auto next = std::make_shared<PermanentMap>(*m_permanent.load(std::memory_order_acquire));
        next->emplace(key, value);
        m_permanent.store(std::move(next), std::memory_order_release);
        m_computed.erase(it);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), key), m_order.end());
        m_promotions.fetch_add(1, std::memory_order_relaxed);
    }

    void EraseComputed(const Key& key) {
        std::unique_lock lock(m_computedMutex);
        if (m_computed.erase(key) > 0) {
            m_order.erase(std::remove(m_order.begin(), m_order.end(), key), m_order.end());
        }
    }

    Options m_options;

    std::atomic<std::shared_ptr<const PermanentMap>> m_permanent;
    std::mutex m_permanentWriteMutex;
    std::atomic<bool> m_frozen{false};

    mutable std::shared_mutex m_computedMutex;
    std::unordered_map<Key, ComputedEntry, Hash> m_computed;
    std::deque<Key> m_order;

    std::atomic<std::size_t> m_hits{0};
    std::atomic<std::size_t> m_misses{0};
    std::atomic<std::size_t> m_loads{0};
    std::atomic<std::size_t> m_evictions{0};
    std::atomic<std::size_t> m_promotions{0};
};

} // namespace mo::cache
