#pragma once

#include <ragcore/cache/cache_clock.h>
#include <ragcore/cache/cache_stats.h>

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ragcore::cache {

/**
 * @brief Thread-safe, capacity-bounded LRU map with per-entry TTL.
 *
 * Every operation takes one mutex: lookups reorder the recency list, so a shared lock would
 * not help. Expired entries are dropped lazily on access or in bulk by removeExpired().
 */
template <typename Value> class LruCache {
public:
    LruCache(size_t capacity, std::chrono::milliseconds defaultTtl,
             SteadyClockFn clock = steadyNow())
        : capacity_(capacity == 0 ? 1 : capacity), defaultTtl_(defaultTtl),
          clock_(std::move(clock)) {
        stats_.maxSize = capacity_;
    }

    /**
     * @brief Look up a live entry and mark it most recently used.
     */
    std::optional<Value> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        auto now = clock_();
        if (now >= it->second->expiresAt) {
            eraseLocked(it);
            ++stats_.ttlExpirations;
            ++stats_.misses;
            return std::nullopt;
        }
        lru_.splice(lru_.begin(), lru_, it->second);
        it->second->hitCount++;
        it->second->lastAccess = now;
        ++stats_.hits;
        return it->second->value;
    }

    /**
     * @brief Insert or replace; ttl of zero selects the default TTL.
     */
    void put(const std::string& key, Value value,
             std::chrono::milliseconds ttl = std::chrono::milliseconds{0}) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        auto expiresAt = now + (ttl.count() > 0 ? ttl : defaultTtl_);

        if (auto it = index_.find(key); it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expiresAt = expiresAt;
            it->second->lastAccess = now;
            lru_.splice(lru_.begin(), lru_, it->second);
            ++stats_.insertions;
            return;
        }

        while (index_.size() >= capacity_ && !lru_.empty()) {
            index_.erase(lru_.back().key);
            lru_.pop_back();
            ++stats_.evictions;
        }

        lru_.push_front(Entry{key, std::move(value), now, expiresAt, now, 0});
        index_.emplace(key, lru_.begin());
        ++stats_.insertions;
        stats_.currentSize = index_.size();
    }

    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        eraseLocked(it);
        ++stats_.invalidations;
        return true;
    }

    /**
     * @brief Remove every entry whose key starts with prefix.
     */
    size_t removePrefix(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = index_.begin(); it != index_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                lru_.erase(it->second);
                it = index_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.invalidations += removed;
        stats_.currentSize = index_.size();
        return removed;
    }

    size_t removeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        size_t removed = 0;
        for (auto it = index_.begin(); it != index_.end();) {
            if (now >= it->second->expiresAt) {
                lru_.erase(it->second);
                it = index_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.ttlExpirations += removed;
        stats_.currentSize = index_.size();
        return removed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.invalidations += index_.size();
        index_.clear();
        lru_.clear();
        stats_.currentSize = 0;
    }

    /**
     * @brief Hits recorded for a live entry, without touching recency.
     */
    std::optional<uint64_t> hitCount(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second->hitCount;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t capacity() const { return capacity_; }

    CacheStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Entry {
        std::string key;
        Value value;
        SteadyTime createdAt;
        SteadyTime expiresAt;
        SteadyTime lastAccess;
        uint64_t hitCount = 0;
    };

    using ListIterator = typename std::list<Entry>::iterator;

    void eraseLocked(typename std::unordered_map<std::string, ListIterator>::iterator it) {
        lru_.erase(it->second);
        index_.erase(it);
        stats_.currentSize = index_.size();
    }

    const size_t capacity_;
    const std::chrono::milliseconds defaultTtl_;
    SteadyClockFn clock_;

    mutable std::mutex mutex_;
    std::list<Entry> lru_; ///< Most recently used first
    std::unordered_map<std::string, ListIterator> index_;
    CacheStats stats_;
};

} // namespace ragcore::cache
