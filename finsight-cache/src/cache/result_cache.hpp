#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace finsight {
namespace cache {

/**
 * Result cache statistics
 */
struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
    size_t expirations = 0;
    size_t entries_count = 0;
};

/**
 * Bounded LRU cache with time-to-live expiry
 *
 * Features:
 * - At most `capacity` entries; inserting a new key when full evicts exactly
 *   one least recently used entry
 * - Entries older than `ttl` are never returned (checked lazily on get)
 * - get() and set() both promote the key to most recently used
 * - Every public call is atomic under one mutex
 * - Injectable clock for deterministic expiry tests
 *
 * Values are returned by copy so callers never hold references into the cache.
 */
template <typename V>
class ResultCache {
public:
    using Key = std::string;
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;

    static constexpr size_t DEFAULT_CAPACITY = 20;
    static constexpr std::chrono::seconds DEFAULT_TTL{300};

    /**
     * Constructor
     * @param capacity Maximum number of entries (clamped to at least 1)
     * @param ttl Maximum age of an entry before it is treated as absent
     * @param clock Time source (default: system_clock::now)
     */
    explicit ResultCache(size_t capacity = DEFAULT_CAPACITY,
                         std::chrono::seconds ttl = DEFAULT_TTL,
                         Clock clock = nullptr)
        : capacity_(std::max<size_t>(capacity, 1))
        , ttl_(ttl)
        , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    {}

    /**
     * Look up a key
     * @param key Cache key
     * @return Copy of the value, or nullopt on miss or expiry
     */
    std::optional<V> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            misses_++;
            return std::nullopt;
        }

        if (clock_() - it->second.inserted_at > ttl_) {
            lru_list_.erase(it->second.position);
            entries_.erase(it);
            expirations_++;
            misses_++;
            return std::nullopt;
        }

        touch(it->second);
        hits_++;
        return it->second.value;
    }

    /**
     * Insert or overwrite a key
     *
     * Overwriting refreshes the insertion time and promotes the key.
     * Inserting a new key at capacity evicts the least recently used entry.
     */
    void set(const Key& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);

        TimePoint now = clock_();
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.inserted_at = now;
            touch(it->second);
            return;
        }

        if (entries_.size() >= capacity_) {
            evict_lru();
        }

        lru_list_.push_back(key);
        auto position = std::prev(lru_list_.end());
        entries_.emplace(key, Entry{std::move(value), now, position});
    }

    /**
     * Remove every entry
     */
    void invalidate_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        lru_list_.clear();
    }

    /**
     * Remove every entry whose key satisfies the predicate
     * @param predicate Pure function of the key; called under the cache lock
     * @return Number of entries removed
     */
    size_t invalidate(const std::function<bool(const Key&)>& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t removed = 0;
        for (auto it = lru_list_.begin(); it != lru_list_.end();) {
            if (predicate(*it)) {
                entries_.erase(*it);
                it = lru_list_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /**
     * Check for a key without promoting it or counting a hit
     */
    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && clock_() - it->second.inserted_at <= ttl_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const { return capacity_; }
    std::chrono::seconds ttl() const { return ttl_; }

    /**
     * Get cache statistics
     */
    CacheStats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        CacheStats stats;
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.expirations = expirations_;
        stats.entries_count = entries_.size();
        return stats;
    }

private:
    struct Entry {
        V value;
        TimePoint inserted_at;
        std::list<Key>::iterator position;
    };

    // Front of the list is least recently used, back is most recently used
    void touch(Entry& entry) {
        lru_list_.splice(lru_list_.end(), lru_list_, entry.position);
    }

    void evict_lru() {
        if (lru_list_.empty()) {
            return;
        }
        entries_.erase(lru_list_.front());
        lru_list_.pop_front();
        evictions_++;
    }

    const size_t capacity_;
    const std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;

    std::list<Key> lru_list_;
    std::unordered_map<Key, Entry> entries_;

    // Statistics
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
    size_t expirations_ = 0;
};

} // namespace cache
} // namespace finsight
