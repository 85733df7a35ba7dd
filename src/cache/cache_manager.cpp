#include <ragcore/cache/cache_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace ragcore::cache {

const char* tierToString(CacheTier tier) {
    switch (tier) {
        case CacheTier::L1:
            return "L1";
        case CacheTier::L2:
            return "L2";
        case CacheTier::L3:
            return "L3";
    }
    return "unknown";
}

Result<void> CacheManagerConfig::validate() const {
    for (const auto* tier : {&l1, &l2, &l3}) {
        if (!tier->enabled) {
            continue;
        }
        if (tier->capacity == 0) {
            return Error{ErrorCode::ValidationError, "cache tier capacity must be positive"};
        }
        if (tier->embedding_ttl.count() <= 0 || tier->query_ttl.count() <= 0) {
            return Error{ErrorCode::ValidationError, "cache TTLs must be positive"};
        }
    }
    if (l1.enabled && l3.enabled &&
        (l1.embedding_ttl > l3.embedding_ttl || l1.query_ttl > l3.query_ttl)) {
        return Error{ErrorCode::ValidationError, "L1 TTLs must not exceed L3 TTLs"};
    }
    if (tier_cooldown.count() < 0) {
        return Error{ErrorCode::ValidationError, "tier_cooldown must not be negative"};
    }
    return {};
}

CacheManager::CacheManager(CacheManagerConfig config, std::shared_ptr<ICacheBackend> l2,
                           std::shared_ptr<IAnalyticsCacheBackend> l3, SteadyClockFn clock)
    : config_(std::move(config)), clock_(std::move(clock)),
      l2_(CacheTier::L2, config_.l2, std::move(l2), config_.tier_cooldown, clock_),
      l3_(CacheTier::L3, config_.l3, l3, config_.tier_cooldown, clock_),
      l3Analytics_(std::move(l3)) {}

CacheManager::~CacheManager() {
    close();
}

Result<void> CacheManager::open() {
    if (open_.load()) {
        return {};
    }
    if (auto r = config_.validate(); !r) {
        return r;
    }

    if (config_.l1.enabled) {
        l1_ = std::make_unique<LruCache<std::string>>(config_.l1.capacity,
                                                      config_.l1.embedding_ttl, clock_);
    }

    for (auto* tier : {&l2_, &l3_}) {
        if (!tier->backend || !tier->config.enabled) {
            continue;
        }
        try {
            if (auto r = tier->backend->open(); !r) {
                fail(*tier, "open", r.error().message);
            } else {
                tier->health.markUp();
            }
        } catch (const std::exception& e) {
            fail(*tier, "open", e.what());
        }
    }

    open_.store(true);
    spdlog::debug("Cache manager open (L2 {}, L3 {})", tierStateToString(l2_.health.state()),
                  tierStateToString(l3_.health.state()));

    if (config_.warm_on_open > 0) {
        auto loaded = warm(config_.warm_on_open);
        spdlog::info("Warmed L1 with {} entries from L3", loaded);
    }
    return {};
}

void CacheManager::close() {
    if (!open_.exchange(false)) {
        return;
    }
    for (auto* tier : {&l2_, &l3_}) {
        if (tier->backend) {
            tier->backend->close();
        }
    }
    if (l1_) {
        l1_->clear();
    }
}

std::chrono::milliseconds CacheManager::ttlFor(const CacheTierConfig& config,
                                               const std::string& key) {
    if (std::string_view(key).substr(0, kQueryNamespace.size()) == kQueryNamespace) {
        return config.query_ttl;
    }
    return config.embedding_ttl;
}

bool CacheManager::admit(RemoteTier& tier) {
    if (!tier.backend || !tier.config.enabled) {
        return false;
    }
    switch (tier.health.admit()) {
        case TierAdmission::Use:
            return true;
        case TierAdmission::Skip:
            tier.counters.skipped.fetch_add(1);
            return false;
        case TierAdmission::Recheck:
            break;
    }

    bool healthy = false;
    try {
        healthy = tier.backend->health();
    } catch (const std::exception& e) {
        spdlog::warn("Cache tier {} health check threw: {}", tierToString(tier.tier), e.what());
    }
    if (!healthy) {
        tier.health.markDown();
        tier.counters.skipped.fetch_add(1);
        spdlog::debug("Cache tier {} still down", tierToString(tier.tier));
        return false;
    }
    tier.health.markUp();
    spdlog::info("Cache tier {} ({}) recovered", tierToString(tier.tier), tier.backend->name());
    return true;
}

void CacheManager::fail(RemoteTier& tier, std::string_view operation, const std::string& cause) {
    tier.counters.failures.fetch_add(1);
    if (tier.health.markDown()) {
        spdlog::warn("Cache tier {} ({}) {} failed, skipping it for {}ms: {}",
                     tierToString(tier.tier), tier.backend->name(), operation,
                     config_.tier_cooldown.count(), cause);
    } else {
        spdlog::debug("Cache tier {} {} failed while down: {}", tierToString(tier.tier), operation,
                      cause);
    }
}

std::optional<std::string> CacheManager::remoteGet(RemoteTier& tier, const std::string& key) {
    if (!admit(tier)) {
        return std::nullopt;
    }
    try {
        auto result = tier.backend->get(key);
        if (!result) {
            fail(tier, "get", result.error().message);
            return std::nullopt;
        }
        auto& value = result.value();
        if (value) {
            tier.counters.hits.fetch_add(1);
        } else {
            tier.counters.misses.fetch_add(1);
        }
        return std::move(value);
    } catch (const std::exception& e) {
        fail(tier, "get", e.what());
        return std::nullopt;
    }
}

bool CacheManager::remoteSet(RemoteTier& tier, const std::string& key, const std::string& value,
                             const std::string& label) {
    if (!admit(tier)) {
        return false;
    }
    try {
        auto result = tier.backend->set(key, value, ttlFor(tier.config, key), label);
        if (!result) {
            fail(tier, "set", result.error().message);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        fail(tier, "set", e.what());
        return false;
    }
}

void CacheManager::remoteRemove(RemoteTier& tier, const std::string& key) {
    if (!admit(tier)) {
        return;
    }
    try {
        if (auto result = tier.backend->remove(key); !result) {
            fail(tier, "remove", result.error().message);
        }
    } catch (const std::exception& e) {
        fail(tier, "remove", e.what());
    }
}

size_t CacheManager::remoteRemovePrefix(RemoteTier& tier, const std::string& prefix) {
    if (!admit(tier)) {
        return 0;
    }
    try {
        auto result = tier.backend->removePrefix(prefix);
        if (!result) {
            fail(tier, "removePrefix", result.error().message);
            return 0;
        }
        return result.value();
    } catch (const std::exception& e) {
        fail(tier, "removePrefix", e.what());
        return 0;
    }
}

void CacheManager::backfillL1(const std::string& key, const std::string& value) {
    if (!l1_) {
        return;
    }
    l1_->put(key, value, ttlFor(config_.l1, key));
    l1Counters_.backfills.fetch_add(1);
}

std::optional<std::string> CacheManager::get(const std::string& key, CacheTier* hitTier) {
    if (!open_.load()) {
        return std::nullopt;
    }

    if (l1_) {
        if (auto value = l1_->get(key)) {
            l1Counters_.hits.fetch_add(1);
            if (hitTier) {
                *hitTier = CacheTier::L1;
            }
            return value;
        }
        l1Counters_.misses.fetch_add(1);
    }

    if (auto value = remoteGet(l2_, key)) {
        backfillL1(key, *value);
        if (hitTier) {
            *hitTier = CacheTier::L2;
        }
        spdlog::debug("Cache hit in L2 for {}", key);
        return value;
    }

    if (auto value = remoteGet(l3_, key)) {
        if (remoteSet(l2_, key, *value, {})) {
            l2_.counters.backfills.fetch_add(1);
        }
        backfillL1(key, *value);
        if (hitTier) {
            *hitTier = CacheTier::L3;
        }
        spdlog::debug("Cache hit in L3 for {}", key);
        return value;
    }

    return std::nullopt;
}

void CacheManager::put(const std::string& key, const std::string& value,
                       const std::string& label) {
    if (!open_.load()) {
        return;
    }
    if (l1_) {
        l1_->put(key, value, ttlFor(config_.l1, key));
        l1Counters_.writes.fetch_add(1);
    }
    for (auto* tier : {&l2_, &l3_}) {
        if (remoteSet(*tier, key, value, label)) {
            tier->counters.writes.fetch_add(1);
        }
    }
}

void CacheManager::invalidate(const std::string& key) {
    if (!open_.load()) {
        return;
    }
    if (l1_) {
        l1_->remove(key);
    }
    remoteRemove(l2_, key);
    remoteRemove(l3_, key);
}

size_t CacheManager::invalidateNamespace(std::string_view prefix) {
    if (!open_.load()) {
        return 0;
    }
    const std::string p(prefix);
    size_t removed = l1_ ? l1_->removePrefix(p) : 0;
    removed += remoteRemovePrefix(l2_, p);
    removed += remoteRemovePrefix(l3_, p);
    if (removed > 0) {
        spdlog::debug("Invalidated {} cache entries under '{}'", removed, p);
    }
    return removed;
}

Result<std::vector<QueryHit>> CacheManager::topQueries(size_t limit) {
    if (!open_.load() || !l3Analytics_ || !admit(l3_)) {
        return Error{ErrorCode::CacheTierUnavailable, "L3 cache tier is not available"};
    }
    try {
        auto result = l3Analytics_->topQueries(limit);
        if (!result) {
            fail(l3_, "topQueries", result.error().message);
        }
        return result;
    } catch (const std::exception& e) {
        fail(l3_, "topQueries", e.what());
        return Error{ErrorCode::CacheTierUnavailable, e.what()};
    }
}

size_t CacheManager::warm(size_t limit) {
    if (!open_.load() || !l1_ || !l3Analytics_ || limit == 0 || !admit(l3_)) {
        return 0;
    }
    try {
        auto result = l3Analytics_->warm(limit);
        if (!result) {
            fail(l3_, "warm", result.error().message);
            return 0;
        }
        size_t loaded = 0;
        for (auto& entry : result.value()) {
            auto ttl = std::min(entry.remaining_ttl, ttlFor(config_.l1, entry.key));
            if (ttl.count() <= 0) {
                continue;
            }
            l1_->put(entry.key, std::move(entry.value), ttl);
            ++loaded;
        }
        return loaded;
    } catch (const std::exception& e) {
        fail(l3_, "warm", e.what());
        return 0;
    }
}

size_t CacheManager::maintenance() {
    if (!open_.load()) {
        return 0;
    }
    size_t purged = l1_ ? l1_->removeExpired() : 0;
    for (auto* tier : {&l2_, &l3_}) {
        if (!admit(*tier)) {
            continue;
        }
        try {
            auto result = tier->backend->clearExpired();
            if (!result) {
                fail(*tier, "clearExpired", result.error().message);
                continue;
            }
            purged += result.value();
        } catch (const std::exception& e) {
            fail(*tier, "clearExpired", e.what());
        }
    }
    return purged;
}

TierStats CacheManager::snapshot(const TierCounters& counters) const {
    TierStats out;
    out.hits = counters.hits.load();
    out.misses = counters.misses.load();
    out.writes = counters.writes.load();
    out.backfills = counters.backfills.load();
    out.failures = counters.failures.load();
    out.skipped = counters.skipped.load();
    return out;
}

CacheManagerStats CacheManager::stats() const {
    CacheManagerStats out;
    out.l1 = snapshot(l1Counters_);
    out.l1.enabled = config_.l1.enabled;
    out.l2 = snapshot(l2_.counters);
    out.l2.state = l2_.health.state();
    out.l2.enabled = config_.l2.enabled && l2_.backend != nullptr;
    out.l3 = snapshot(l3_.counters);
    out.l3.state = l3_.health.state();
    out.l3.enabled = config_.l3.enabled && l3_.backend != nullptr;
    return out;
}

TierState CacheManager::tierState(CacheTier tier) const {
    switch (tier) {
        case CacheTier::L1:
            return TierState::Up;
        case CacheTier::L2:
            return l2_.health.state();
        case CacheTier::L3:
            return l3_.health.state();
    }
    return TierState::Down;
}

} // namespace ragcore::cache
