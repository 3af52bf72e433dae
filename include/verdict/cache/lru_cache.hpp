/** \file lru_cache.hpp
 *  \brief Count-bounded, thread-safe LRU store.
 *
 * One coarse lock guards the recency list and the index, so a lookup, an
 * insert and the eviction it triggers are a single critical section.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace verdict::cache {

/**
 * \brief Counters for cache performance monitoring
 */
struct CacheStats {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> evictions{0};
    std::atomic<std::uint64_t> inserts{0};
    std::atomic<std::uint64_t> updates{0};

    CacheStats() = default;

    CacheStats(const CacheStats& other)
        : hits(other.hits.load())
        , misses(other.misses.load())
        , evictions(other.evictions.load())
        , inserts(other.inserts.load())
        , updates(other.updates.load()) {}

    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            evictions.store(other.evictions.load());
            inserts.store(other.inserts.load());
            updates.store(other.updates.load());
        }
        return *this;
    }

    [[nodiscard]] auto hit_rate() const -> double {
        auto total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / static_cast<double>(total) : 0.0;
    }

    void reset() {
        hits = 0;
        misses = 0;
        evictions = 0;
        inserts = 0;
        updates = 0;
    }
};

/**
 * \brief Called with the key and value of every entry leaving the cache
 *        through eviction or clear(); runs under the cache lock.
 */
template<typename K, typename V>
using EvictionCallback = std::function<void(const K&, const V&)>;

template<typename K, typename V, typename Hash = std::hash<K>>
class LruCache {
public:
    using KeyType = K;
    using ValueType = V;

    struct Entry {
        K key;
        V value;
    };

    using ListIterator = typename std::list<Entry>::iterator;

    /** \param capacity maximum entry count; values below 1 are treated as 1 */
    explicit LruCache(std::size_t capacity, EvictionCallback<K, V> on_evict = nullptr)
        : capacity_(capacity > 0 ? capacity : 1)
        , on_evict_(std::move(on_evict)) {}

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;
    LruCache(LruCache&&) = delete;
    LruCache& operator=(LruCache&&) = delete;

    /**
     * \brief Look up and promote to most recently used
     */
    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            stats_.misses.fetch_add(1);
            return std::nullopt;
        }
        touch(it->second);
        stats_.hits.fetch_add(1);
        return it->second->value;
    }

    /**
     * \brief Look up without promoting or counting
     */
    [[nodiscard]] auto peek(const K& key) const -> std::optional<V> {
        std::shared_lock lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return it->second->value;
    }

    /**
     * \brief Insert or replace, evicting the least recently used entry on overflow
     */
    auto put(const K& key, V value) -> void {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            touch(it->second);
            stats_.updates.fetch_add(1);
            return;
        }
        insert_front(key, std::move(value));
    }

    /**
     * \brief Insert unless present; returns the resident value either way
     *
     * Two racing producers of the same key both end up with the first
     * inserted value.
     */
    auto get_or_insert(const K& key, V value) -> V {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            touch(it->second);
            return it->second->value;
        }
        insert_front(key, std::move(value));
        return lru_list_.front().value;
    }

    auto remove(const K& key) -> bool {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        lru_list_.erase(it->second);
        index_.erase(it);
        return true;
    }

    /**
     * \brief Drop every entry; counters are kept (see reset_stats())
     */
    auto clear() -> void {
        std::unique_lock lock(mutex_);

        if (on_evict_) {
            for (const auto& entry : lru_list_) {
                on_evict_(entry.key, entry.value);
            }
        }
        lru_list_.clear();
        index_.clear();
    }

    auto reset_stats() -> void { stats_.reset(); }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    [[nodiscard]] auto contains(const K& key) const -> bool {
        std::shared_lock lock(mutex_);
        return index_.find(key) != index_.end();
    }

    /** \brief Keys from most to least recently used. */
    [[nodiscard]] auto keys() const -> std::vector<K> {
        std::shared_lock lock(mutex_);
        std::vector<K> out;
        out.reserve(lru_list_.size());
        for (const auto& entry : lru_list_) out.push_back(entry.key);
        return out;
    }

    [[nodiscard]] auto stats() const -> CacheStats { return stats_; }

private:
    auto touch(ListIterator list_it) -> void {
        if (list_it != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
        }
    }

    auto insert_front(const K& key, V value) -> void {
        while (index_.size() >= capacity_ && !lru_list_.empty()) {
            evict_back();
        }
        lru_list_.emplace_front(Entry{key, std::move(value)});
        index_[key] = lru_list_.begin();
        stats_.inserts.fetch_add(1);
    }

    auto evict_back() -> void {
        auto list_it = std::prev(lru_list_.end());
        if (on_evict_) {
            on_evict_(list_it->key, list_it->value);
        }
        index_.erase(list_it->key);
        lru_list_.erase(list_it);
        stats_.evictions.fetch_add(1);
    }

    mutable std::shared_mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<K, ListIterator, Hash> index_;

    std::size_t capacity_;
    EvictionCallback<K, V> on_evict_;

    CacheStats stats_;
};

} // namespace verdict::cache
