#pragma once

#include <ragcore/cache/cache_backend.h>
#include <ragcore/cache/cache_clock.h>

#include <map>
#include <mutex>

namespace ragcore::cache {

/**
 * @brief In-process TTL store implementing the L2 contract.
 *
 * Stands in for a shared network cache in single-process deployments and tests. Capacity is
 * enforced by dropping the entry closest to expiry.
 */
class MemoryCacheBackend : public ICacheBackend {
public:
    explicit MemoryCacheBackend(size_t capacity = 100000, WallClockFn clock = wallNow());

    std::string name() const override { return "memory"; }

    Result<void> open() override;
    void close() override;

    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value,
                     std::chrono::milliseconds ttl, const std::string& label) override;
    Result<void> remove(const std::string& key) override;
    Result<size_t> removePrefix(const std::string& prefix) override;
    Result<size_t> clearExpired() override;
    bool health() override;

    size_t size() const;

private:
    struct Entry {
        std::string value;
        WallTime expiresAt;
    };

    Result<void> requireOpen() const;

    const size_t capacity_;
    WallClockFn clock_;
    mutable std::mutex mutex_;
    bool open_ = false;
    std::map<std::string, Entry> entries_;
};

} // namespace ragcore::cache
