#pragma once

#include <ragcore/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ragcore::cache {

/**
 * @brief A query ranked by how often its cached result was served.
 */
struct QueryHit {
    std::string query;
    uint64_t hit_count = 0;
};

/**
 * @brief A live entry handed back by warm(), with the TTL it has left.
 */
struct WarmEntry {
    std::string key;
    std::string value;
    std::chrono::milliseconds remaining_ttl{0};
};

/**
 * @brief Contract for the shared (L2) and persistent (L3) cache tiers.
 *
 * Values are opaque byte strings. Implementations report unreachability through
 * Result errors (CacheTierUnavailable or DatabaseError); the cache manager turns those into
 * a cool-down instead of propagating them.
 */
class ICacheBackend {
public:
    virtual ~ICacheBackend() = default;

    virtual std::string name() const = 0;

    virtual Result<void> open() = 0;
    virtual void close() = 0;

    /**
     * @brief Fetch a live value; std::nullopt on miss or expiry.
     */
    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    /**
     * @brief Store a value for ttl. label is a human-readable description (the query
     * text for cached results) used by analytics.
     */
    virtual Result<void> set(const std::string& key, const std::string& value,
                             std::chrono::milliseconds ttl, const std::string& label) = 0;

    virtual Result<void> remove(const std::string& key) = 0;

    /**
     * @brief Remove all keys starting with prefix.
     * @return number of entries removed
     */
    virtual Result<size_t> removePrefix(const std::string& prefix) = 0;

    /**
     * @brief Purge expired entries.
     * @return number of entries removed
     */
    virtual Result<size_t> clearExpired() = 0;

    /**
     * @brief Cheap reachability check used after a cool-down.
     */
    virtual bool health() = 0;
};

/**
 * @brief Persistent tier that also tracks hit counts for analytics.
 */
class IAnalyticsCacheBackend : public ICacheBackend {
public:
    /**
     * @brief Most frequently served labelled entries, highest hit count first.
     */
    virtual Result<std::vector<QueryHit>> topQueries(size_t limit) = 0;

    /**
     * @brief Up to limit live entries, most served first, for preloading faster tiers.
     */
    virtual Result<std::vector<WarmEntry>> warm(size_t limit) = 0;
};

} // namespace ragcore::cache
