#include <gtest/gtest.h>
#include <ragcore/cache/embedding_cache.h>
#include <ragcore/cache/memory_cache_backend.h>
#include <ragcore/cache/sqlite_cache_backend.h>

#include "../../common/manual_clock.h"

#include <memory>

using namespace ragcore;
using namespace ragcore::cache;
using ragcore::test::ManualClock;

class EmbeddingCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        l3_ = std::make_shared<SqliteCacheBackend>(":memory:", 1000, clock_.wall());
        manager_ = std::make_shared<CacheManager>(
            CacheManagerConfig{}, std::make_shared<MemoryCacheBackend>(1000, clock_.wall()), l3_,
            clock_.steady());
        ASSERT_TRUE(manager_->open());
        cache_ = std::make_unique<EmbeddingCache>(manager_);
    }

    ManualClock clock_;
    std::shared_ptr<SqliteCacheBackend> l3_;
    std::shared_ptr<CacheManager> manager_;
    std::unique_ptr<EmbeddingCache> cache_;
};

TEST_F(EmbeddingCacheTest, KeysAreContentAddressedPerModel) {
    auto a = EmbeddingCache::makeKey("model-a", "vpn policy");
    EXPECT_EQ(a, EmbeddingCache::makeKey("model-a", "vpn policy"));
    EXPECT_NE(a, EmbeddingCache::makeKey("model-b", "vpn policy"));
    EXPECT_NE(a, EmbeddingCache::makeKey("model-a", "vpn policy "));
    // The separator keeps model and text from running together
    EXPECT_NE(EmbeddingCache::makeKey("ab", "c"), EmbeddingCache::makeKey("a", "bc"));
    EXPECT_EQ(a.rfind("emb:", 0), 0u);
    EXPECT_EQ(a.size(), 4u + 64u);
}

TEST_F(EmbeddingCacheTest, StoredVectorIsReturnedExactly) {
    Embedding vec{0.25f, -1.5f, 3.0f, 0.0f};
    cache_->put("model", "hello world", vec);

    auto cached = cache_->get("model", "hello world", 4);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, vec);
    EXPECT_FALSE(cache_->get("other-model", "hello world").has_value());
    EXPECT_EQ(cache_->hits(), 1u);
    EXPECT_EQ(cache_->misses(), 1u);
}

TEST_F(EmbeddingCacheTest, DimensionMismatchIsTreatedAsMiss) {
    cache_->put("model", "text", Embedding{1.0f, 2.0f});
    EXPECT_FALSE(cache_->get("model", "text", 3).has_value());
    // The stale entry is gone from every tier
    EXPECT_FALSE(cache_->get("model", "text").has_value());
}

TEST_F(EmbeddingCacheTest, CorruptBytesAreDropped) {
    manager_->put(EmbeddingCache::makeKey("model", "text"), "abc");
    EXPECT_FALSE(cache_->get("model", "text").has_value());
    auto stored = l3_->get(EmbeddingCache::makeKey("model", "text"));
    ASSERT_TRUE(stored);
    EXPECT_FALSE(stored.value().has_value());
}

TEST(EmbeddingCodecTest, RejectsTruncatedBlobs) {
    auto bytes = encodeEmbedding(Embedding{1.0f, 2.0f, 3.0f});
    EXPECT_EQ(bytes.size(), 3 * sizeof(float));
    ASSERT_TRUE(decodeEmbedding(bytes));

    auto truncated = decodeEmbedding(std::string_view(bytes).substr(0, bytes.size() - 1));
    ASSERT_FALSE(truncated);
    EXPECT_EQ(truncated.error().code, ErrorCode::InvalidData);
    EXPECT_FALSE(decodeEmbedding(""));
}

TEST(EmbeddingCacheWithoutManagerTest, AlwaysMisses) {
    EmbeddingCache cache(nullptr);
    cache.put("m", "t", Embedding{1.0f});
    EXPECT_FALSE(cache.get("m", "t").has_value());
    EXPECT_EQ(cache.misses(), 1u);
}
