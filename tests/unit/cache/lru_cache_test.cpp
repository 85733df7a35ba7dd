#include <gtest/gtest.h>
#include <ragcore/cache/lru_cache.h>

#include "../../common/manual_clock.h"

#include <string>
#include <thread>
#include <vector>

using namespace ragcore::cache;
using ragcore::test::ManualClock;
using namespace std::chrono_literals;

class LruCacheTest : public ::testing::Test {
protected:
    ManualClock clock_;
};

TEST_F(LruCacheTest, PutThenGetReturnsValue) {
    LruCache<std::string> cache(4, 1h, clock_.steady());
    cache.put("a", "alpha");
    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "alpha");
    EXPECT_FALSE(cache.get("missing").has_value());

    auto stats = cache.getStats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.5);
    EXPECT_EQ(stats.currentSize, 1u);
    EXPECT_EQ(stats.maxSize, 4u);
}

TEST_F(LruCacheTest, EvictsLeastRecentlyUsed) {
    LruCache<std::string> cache(2, 1h, clock_.steady());
    cache.put("a", "1");
    cache.put("b", "2");
    ASSERT_TRUE(cache.get("a").has_value()); // b is now least recent
    cache.put("c", "3");

    EXPECT_TRUE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.getStats().evictions, 1u);
}

TEST_F(LruCacheTest, EntriesExpireAfterTtl) {
    LruCache<std::string> cache(4, 10min, clock_.steady());
    cache.put("default", "x");
    cache.put("short", "y", 1min);

    clock_.advance(2min);
    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_TRUE(cache.get("default").has_value());

    clock_.advance(10min);
    EXPECT_FALSE(cache.get("default").has_value());
    EXPECT_EQ(cache.getStats().ttlExpirations, 2u);
}

TEST_F(LruCacheTest, RemoveExpiredPurgesInBulk) {
    LruCache<int> cache(10, 1min, clock_.steady());
    for (int i = 0; i < 5; ++i) {
        cache.put("k" + std::to_string(i), i);
    }
    cache.put("long", 99, 1h);
    clock_.advance(5min);
    EXPECT_EQ(cache.removeExpired(), 5u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(LruCacheTest, RemovePrefixOnlyTouchesNamespace) {
    LruCache<std::string> cache(10, 1h, clock_.steady());
    cache.put("query:1", "a");
    cache.put("query:2", "b");
    cache.put("emb:1", "c");

    EXPECT_EQ(cache.removePrefix("query:"), 2u);
    EXPECT_FALSE(cache.get("query:1").has_value());
    EXPECT_TRUE(cache.get("emb:1").has_value());
}

TEST_F(LruCacheTest, ReplacingKeepsSingleEntryAndTracksHits) {
    LruCache<std::string> cache(4, 1h, clock_.steady());
    cache.put("a", "old");
    cache.put("a", "new");
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(*cache.get("a"), "new");
    EXPECT_EQ(*cache.get("a"), "new");
    EXPECT_EQ(cache.hitCount("a").value_or(0), 2u);
}

TEST_F(LruCacheTest, ConcurrentAccessStaysBounded) {
    LruCache<int> cache(64, 1h, clock_.steady());
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                auto key = "k" + std::to_string((t * 131 + i) % 200);
                cache.put(key, i);
                (void)cache.get(key);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_LE(cache.size(), 64u);
}
