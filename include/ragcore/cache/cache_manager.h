#pragma once

#include <ragcore/cache/cache_backend.h>
#include <ragcore/cache/cache_clock.h>
#include <ragcore/cache/lru_cache.h>
#include <ragcore/cache/tier_health.h>
#include <ragcore/core/types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragcore::cache {

// Key namespaces; TTLs are chosen per namespace
inline constexpr std::string_view kEmbeddingNamespace = "emb:";
inline constexpr std::string_view kQueryNamespace = "query:";

enum class CacheTier { L1, L2, L3 };

const char* tierToString(CacheTier tier);

struct CacheTierConfig {
    bool enabled = true;
    size_t capacity = 0;
    std::chrono::milliseconds embedding_ttl{0};
    std::chrono::milliseconds query_ttl{0};
};

/**
 * @brief Tier sizing, TTLs and failure handling for CacheManager.
 */
struct CacheManagerConfig {
    CacheTierConfig l1{true, 10000, std::chrono::hours(24), std::chrono::minutes(5)};
    CacheTierConfig l2{true, 100000, std::chrono::hours(24 * 7), std::chrono::hours(1)};
    CacheTierConfig l3{true, 1000000, std::chrono::hours(24 * 30), std::chrono::hours(24)};

    std::chrono::milliseconds tier_cooldown{30000}; ///< How long a failed tier is skipped
    std::filesystem::path l3_path;                  ///< SQLite file; empty keeps L3 in memory
    size_t warm_on_open = 0;                        ///< L3 entries preloaded into L1 by open()

    Result<void> validate() const;
};

struct TierStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t writes = 0;
    uint64_t backfills = 0;
    uint64_t failures = 0;
    uint64_t skipped = 0; ///< Requests that bypassed the tier while it was down
    TierState state = TierState::Up;
    bool enabled = true;
};

struct CacheManagerStats {
    TierStats l1;
    TierStats l2;
    TierStats l3;
};

/**
 * @brief Three-tier read-through, write-through cache.
 *
 * Reads try L1, then L2, then L3, and backfill every faster tier on a hit. Writes go to all
 * reachable tiers. A backend error or exception marks that tier down for tier_cooldown; while
 * down the tier is skipped without being called, and once the cool-down elapses a single
 * health() check decides whether it is used again. Lookups never fail: an unreachable tier
 * only costs speed or capacity. A manager that has not been opened misses every lookup.
 */
class CacheManager {
public:
    CacheManager(CacheManagerConfig config, std::shared_ptr<ICacheBackend> l2,
                 std::shared_ptr<IAnalyticsCacheBackend> l3, SteadyClockFn clock = steadyNow());
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * @brief Open the backends. A backend that fails to open starts in the down state.
     */
    Result<void> open();
    void close();
    [[nodiscard]] bool isOpen() const { return open_.load(); }

    /**
     * @brief Look a key up through the tiers.
     * @param hitTier set to the tier that served the value
     */
    std::optional<std::string> get(const std::string& key, CacheTier* hitTier = nullptr);

    /**
     * @brief Store a value in every reachable tier. label is kept by L3 for analytics.
     */
    void put(const std::string& key, const std::string& value, const std::string& label = {});

    void invalidate(const std::string& key);

    /**
     * @brief Remove every key starting with prefix from all reachable tiers.
     * @return total entries removed
     */
    size_t invalidateNamespace(std::string_view prefix);

    /**
     * @brief Most served labelled entries, read from L3.
     */
    Result<std::vector<QueryHit>> topQueries(size_t limit);

    /**
     * @brief Preload L1 with the most served live L3 entries.
     * @return number of entries loaded
     */
    size_t warm(size_t limit);

    /**
     * @brief Purge expired L1 entries and expired L3 rows.
     * @return number of entries purged
     */
    size_t maintenance();

    CacheManagerStats stats() const;
    TierState tierState(CacheTier tier) const;

    const CacheManagerConfig& config() const { return config_; }

private:
    struct TierCounters {
        std::atomic<uint64_t> hits{0};
        std::atomic<uint64_t> misses{0};
        std::atomic<uint64_t> writes{0};
        std::atomic<uint64_t> backfills{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> skipped{0};
    };

    struct RemoteTier {
        RemoteTier(CacheTier t, CacheTierConfig c, std::shared_ptr<ICacheBackend> b,
                   std::chrono::milliseconds cooldown, SteadyClockFn clock)
            : tier(t), config(c), backend(std::move(b)), health(cooldown, std::move(clock)) {}

        CacheTier tier;
        CacheTierConfig config;
        std::shared_ptr<ICacheBackend> backend;
        TierHealth health;
        TierCounters counters;
    };

    bool admit(RemoteTier& tier);
    void fail(RemoteTier& tier, std::string_view operation, const std::string& cause);
    std::optional<std::string> remoteGet(RemoteTier& tier, const std::string& key);
    bool remoteSet(RemoteTier& tier, const std::string& key, const std::string& value,
                   const std::string& label);
    void remoteRemove(RemoteTier& tier, const std::string& key);
    size_t remoteRemovePrefix(RemoteTier& tier, const std::string& prefix);
    void backfillL1(const std::string& key, const std::string& value);

    static std::chrono::milliseconds ttlFor(const CacheTierConfig& config,
                                            const std::string& key);
    TierStats snapshot(const TierCounters& counters) const;

    CacheManagerConfig config_;
    SteadyClockFn clock_;
    std::atomic<bool> open_{false};

    std::unique_ptr<LruCache<std::string>> l1_;
    TierCounters l1Counters_;
    RemoteTier l2_;
    RemoteTier l3_;
    std::shared_ptr<IAnalyticsCacheBackend> l3Analytics_;
};

} // namespace ragcore::cache
