#include <gtest/gtest.h>
#include <ragcore/cache/cache_manager.h>
#include <ragcore/cache/memory_cache_backend.h>
#include <ragcore/cache/sqlite_cache_backend.h>

#include "../../common/manual_clock.h"
#include "../../common/test_fakes.h"

#include <memory>

using namespace ragcore;
using namespace ragcore::cache;
using ragcore::test::FlakyCacheBackend;
using ragcore::test::ManualClock;
using namespace std::chrono_literals;

class CacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        l2_ = std::make_shared<FlakyCacheBackend>(
            std::make_shared<MemoryCacheBackend>(1000, clock_.wall()));
        l3_ = std::make_shared<FlakyCacheBackend>(
            std::make_shared<SqliteCacheBackend>(":memory:", 1000, clock_.wall()));
        config_.tier_cooldown = 30s;
    }

    std::unique_ptr<CacheManager> openManager() {
        auto manager = std::make_unique<CacheManager>(config_, l2_, l3_, clock_.steady());
        auto opened = manager->open();
        EXPECT_TRUE(opened) << (opened ? "" : opened.error().message);
        return manager;
    }

    ManualClock clock_;
    CacheManagerConfig config_;
    std::shared_ptr<FlakyCacheBackend> l2_;
    std::shared_ptr<FlakyCacheBackend> l3_;
};

TEST_F(CacheManagerTest, WriteThroughServesFromL1) {
    auto manager = openManager();
    manager->put("emb:k", "vector-bytes");

    CacheTier tier = CacheTier::L3;
    auto value = manager->get("emb:k", &tier);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "vector-bytes");
    EXPECT_EQ(tier, CacheTier::L1);
    EXPECT_EQ(l2_->sets(), 1u);
    EXPECT_EQ(l3_->sets(), 1u);
    EXPECT_EQ(l2_->gets(), 0u);
}

TEST_F(CacheManagerTest, L3HitBackfillsFasterTiers) {
    auto manager = openManager();
    ASSERT_TRUE(l3_->set("emb:cold", "from-disk", 1h, ""));

    CacheTier tier = CacheTier::L1;
    auto value = manager->get("emb:cold", &tier);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(tier, CacheTier::L3);

    auto inL2 = l2_->get("emb:cold");
    ASSERT_TRUE(inL2);
    EXPECT_TRUE(inL2.value().has_value());

    value = manager->get("emb:cold", &tier);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(tier, CacheTier::L1);

    auto stats = manager->stats();
    EXPECT_EQ(stats.l3.hits, 1u);
    EXPECT_EQ(stats.l2.backfills, 1u);
    EXPECT_EQ(stats.l1.backfills, 1u);
    EXPECT_EQ(stats.l1.hits, 1u);
}

TEST_F(CacheManagerTest, L2OutageFallsThroughToL3WithoutRaising) {
    auto manager = openManager();
    ASSERT_TRUE(l3_->set("emb:a", "A", 1h, ""));
    ASSERT_TRUE(l3_->set("emb:b", "B", 1h, ""));
    l2_->setDown(true);

    CacheTier tier = CacheTier::L1;
    auto a = manager->get("emb:a", &tier);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, "A");
    EXPECT_EQ(tier, CacheTier::L3);
    EXPECT_EQ(manager->tierState(CacheTier::L2), TierState::Down);
    EXPECT_EQ(l2_->gets(), 1u);

    // Within the cool-down the broken tier is not called at all
    clock_.advance(10s);
    auto b = manager->get("emb:b", &tier);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(tier, CacheTier::L3);
    EXPECT_EQ(l2_->gets(), 1u);
    EXPECT_EQ(l2_->healthChecks(), 0u);

    auto stats = manager->stats();
    EXPECT_EQ(stats.l2.failures, 1u);
    EXPECT_GE(stats.l2.skipped, 1u);
    EXPECT_EQ(stats.l2.state, TierState::Down);
}

TEST_F(CacheManagerTest, TierIsRecheckedAndReusedAfterCooldown) {
    auto manager = openManager();
    l2_->setDown(true);
    EXPECT_FALSE(manager->get("emb:missing").has_value());
    ASSERT_EQ(manager->tierState(CacheTier::L2), TierState::Down);

    // Still failing once the cool-down passes: one recheck, no get
    clock_.advance(31s);
    EXPECT_FALSE(manager->get("emb:missing").has_value());
    EXPECT_EQ(l2_->healthChecks(), 1u);
    EXPECT_EQ(l2_->gets(), 1u);
    EXPECT_EQ(manager->tierState(CacheTier::L2), TierState::Down);

    l2_->setDown(false);
    clock_.advance(31s);
    ASSERT_TRUE(l2_->set("emb:back", "again", 1h, ""));
    CacheTier tier = CacheTier::L1;
    auto value = manager->get("emb:back", &tier);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(tier, CacheTier::L2);
    EXPECT_EQ(l2_->healthChecks(), 2u);
    EXPECT_EQ(manager->tierState(CacheTier::L2), TierState::Up);
}

TEST_F(CacheManagerTest, EntriesExpireFromEveryTier) {
    auto manager = openManager();
    manager->put("query:q", "ranked", "q");
    ASSERT_TRUE(manager->get("query:q").has_value());

    clock_.advance(config_.l3.query_ttl + 1min);
    EXPECT_FALSE(manager->get("query:q").has_value());
}

TEST_F(CacheManagerTest, UnopenedManagerMissesEverything) {
    CacheManager manager(config_, l2_, l3_, clock_.steady());
    manager.put("emb:k", "v");
    EXPECT_FALSE(manager.get("emb:k").has_value());
    EXPECT_EQ(l2_->sets(), 0u);
    EXPECT_EQ(manager.invalidateNamespace("emb:"), 0u);
    EXPECT_FALSE(manager.isOpen());
}

TEST_F(CacheManagerTest, InvalidateNamespaceClearsAllTiers) {
    auto manager = openManager();
    manager->put("emb:a", "1");
    manager->put("query:a", "2", "first");
    manager->put("query:b", "3", "second");

    EXPECT_EQ(manager->invalidateNamespace(kQueryNamespace), 6u);
    EXPECT_FALSE(manager->get("query:a").has_value());
    EXPECT_FALSE(manager->get("query:b").has_value());
    EXPECT_TRUE(manager->get("emb:a").has_value());

    manager->invalidate("emb:a");
    EXPECT_FALSE(manager->get("emb:a").has_value());
}

TEST_F(CacheManagerTest, TopQueriesComeFromL3HitCounts) {
    auto manager = openManager();
    manager->put("query:1", "r1", "vpn policy");
    manager->put("query:2", "r2", "holiday rules");
    ASSERT_TRUE(l3_->get("query:2"));
    ASSERT_TRUE(l3_->get("query:2"));

    auto top = manager->topQueries(5);
    ASSERT_TRUE(top);
    ASSERT_EQ(top.value().size(), 2u);
    EXPECT_EQ(top.value()[0].query, "holiday rules");
    EXPECT_EQ(top.value()[0].hit_count, 2u);

    CacheManager withoutL3(config_, l2_, nullptr, clock_.steady());
    ASSERT_TRUE(withoutL3.open());
    auto none = withoutL3.topQueries(5);
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, ErrorCode::CacheTierUnavailable);
}

TEST_F(CacheManagerTest, WarmPreloadsL1FromL3) {
    ASSERT_TRUE(l3_->open());
    ASSERT_TRUE(l3_->set("emb:hot", "H", 1h, ""));
    ASSERT_TRUE(l3_->get("emb:hot"));

    config_.warm_on_open = 10;
    auto manager = openManager();
    l3_->setDown(true);
    l2_->setDown(true);

    CacheTier tier = CacheTier::L3;
    auto value = manager->get("emb:hot", &tier);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(tier, CacheTier::L1);
}

TEST_F(CacheManagerTest, MaintenancePurgesExpiredEntries) {
    config_.l1.query_ttl = 1min;
    config_.l2.query_ttl = 2min;
    config_.l3.query_ttl = 3min;
    auto manager = openManager();
    manager->put("query:a", "r", "a");
    manager->put("emb:a", "v");

    clock_.advance(5min);
    EXPECT_EQ(manager->maintenance(), 3u);
    EXPECT_TRUE(manager->get("emb:a").has_value());
}

TEST_F(CacheManagerTest, OpenRejectsInconsistentTtls) {
    config_.l1.query_ttl = 48h;
    CacheManager manager(config_, l2_, l3_, clock_.steady());
    auto opened = manager.open();
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::ValidationError);
}
