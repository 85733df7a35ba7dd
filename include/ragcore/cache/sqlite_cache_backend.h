#pragma once

#include <ragcore/cache/cache_backend.h>
#include <ragcore/cache/cache_clock.h>
#include <ragcore/storage/database.h>

#include <filesystem>
#include <mutex>

namespace ragcore::cache {

struct SqliteCacheStats {
    uint64_t entries = 0;
    uint64_t expired = 0;
    uint64_t total_hits = 0;
    uint64_t value_bytes = 0;
};

/**
 * @brief Persistent L3 cache tier backed by a SQLite file.
 *
 * Each row keeps its creation, expiry and last-access times plus a hit counter that is
 * incremented on every served read; topQueries() sums that counter per label and ranks
 * the labels.
 * When the row count exceeds capacity the least recently accessed rows are dropped.
 * An empty path or ":memory:" opens a private in-memory database.
 */
class SqliteCacheBackend : public IAnalyticsCacheBackend {
public:
    explicit SqliteCacheBackend(std::filesystem::path path, size_t capacity = 1000000,
                                WallClockFn clock = wallNow());
    ~SqliteCacheBackend() override;

    std::string name() const override { return "sqlite"; }

    Result<void> open() override;
    void close() override;

    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value,
                     std::chrono::milliseconds ttl, const std::string& label) override;
    Result<void> remove(const std::string& key) override;
    Result<size_t> removePrefix(const std::string& prefix) override;
    Result<size_t> clearExpired() override;
    bool health() override;

    Result<std::vector<QueryHit>> topQueries(size_t limit) override;
    Result<std::vector<WarmEntry>> warm(size_t limit) override;

    Result<SqliteCacheStats> stats();

    /**
     * @brief Hit counter of a stored row, expired or not.
     */
    Result<std::optional<uint64_t>> hitCount(const std::string& key);

private:
    Result<void> createSchema();
    Result<void> enforceCapacity();
    int64_t nowMillis() const;

    std::filesystem::path path_;
    const size_t capacity_;
    WallClockFn clock_;
    std::mutex mutex_;
    storage::Database db_;
};

} // namespace ragcore::cache
