#include <gtest/gtest.h>
#include <ragcore/cache/memory_cache_backend.h>
#include <ragcore/vector/embedding_batcher.h>

#include "../../common/manual_clock.h"
#include "../../common/test_fakes.h"

#include <memory>

using namespace ragcore;
using namespace ragcore::vector;
using ragcore::test::ConceptEmbedder;
using ragcore::test::ManualClock;

class EmbeddingBatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        embedder_ = std::make_shared<ConceptEmbedder>(32);
        auto manager = std::make_shared<cache::CacheManager>(
            cache::CacheManagerConfig{},
            std::make_shared<cache::MemoryCacheBackend>(1000, clock_.wall()), nullptr,
            clock_.steady());
        ASSERT_TRUE(manager->open());
        cache_ = std::make_shared<cache::EmbeddingCache>(manager);
    }

    std::vector<std::string> corpus(size_t n) {
        std::vector<std::string> texts;
        for (size_t i = 0; i < n; ++i) {
            texts.push_back("paragraph number " + std::to_string(i) + " about remote access");
        }
        return texts;
    }

    ManualClock clock_;
    std::shared_ptr<ConceptEmbedder> embedder_;
    std::shared_ptr<cache::EmbeddingCache> cache_;
};

TEST_F(EmbeddingBatcherTest, ResultsFollowInputOrderAcrossBatches) {
    EmbeddingBatcher batcher(embedder_, cache_, EmbeddingBatcherConfig{4, 3});
    auto texts = corpus(10);

    BatchEmbeddingStats stats;
    auto results = batcher.embedAll(texts, &stats);
    ASSERT_EQ(results.size(), texts.size());
    EXPECT_EQ(stats.batches, 3u);
    EXPECT_EQ(stats.computed, 10u);
    EXPECT_EQ(stats.failures, 0u);

    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(results[i].index, i);
        ASSERT_TRUE(results[i].embedding);
        auto direct = embedder_->embed(texts[i]);
        ASSERT_TRUE(direct);
        EXPECT_EQ(results[i].embedding.value(), direct.value());
    }
}

TEST_F(EmbeddingBatcherTest, SecondPassIsServedFromCache) {
    EmbeddingBatcher batcher(embedder_, cache_, EmbeddingBatcherConfig{8, 2});
    auto texts = corpus(12);
    (void)batcher.embedAll(texts);
    const auto callsAfterFirst = embedder_->calls();

    BatchEmbeddingStats stats;
    auto again = batcher.embedAll(texts, &stats);
    EXPECT_EQ(embedder_->calls(), callsAfterFirst);
    EXPECT_EQ(stats.cache_hits, 12u);
    for (const auto& item : again) {
        EXPECT_TRUE(item.cache_hit);
        EXPECT_TRUE(item.embedding);
    }
}

TEST_F(EmbeddingBatcherTest, FailuresStayWithTheirText) {
    embedder_->failTextsContaining("number 3 ");
    EmbeddingBatcher batcher(embedder_, cache_, EmbeddingBatcherConfig{2, 2});
    auto texts = corpus(6);

    BatchEmbeddingStats stats;
    auto results = batcher.embedAll(texts, &stats);
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(stats.computed, 5u);
    ASSERT_FALSE(results[3].embedding);
    EXPECT_EQ(results[3].embedding.error().code, ErrorCode::EmbeddingUnavailable);
    EXPECT_TRUE(results[2].embedding);
    EXPECT_TRUE(results[4].embedding);
}

TEST_F(EmbeddingBatcherTest, ThrowingEmbedderBecomesEmbeddingUnavailable) {
    embedder_->setThrowing(true);
    EmbeddingBatcher batcher(embedder_, nullptr, EmbeddingBatcherConfig{1, 2});
    auto results = batcher.embedAll(corpus(3));
    for (const auto& item : results) {
        ASSERT_FALSE(item.embedding);
        EXPECT_EQ(item.embedding.error().code, ErrorCode::EmbeddingUnavailable);
    }
}

TEST_F(EmbeddingBatcherTest, EmptyInputProducesNoBatches) {
    EmbeddingBatcher batcher(embedder_, cache_);
    BatchEmbeddingStats stats;
    EXPECT_TRUE(batcher.embedAll({}, &stats).empty());
    EXPECT_EQ(stats.batches, 0u);
}

TEST_F(EmbeddingBatcherTest, EmbedOneUsesCacheFirst) {
    EmbeddingBatcher batcher(embedder_, cache_);
    auto first = batcher.embedOne("vpn access");
    ASSERT_TRUE(first.embedding);
    EXPECT_FALSE(first.cache_hit);
    auto second = batcher.embedOne("vpn access");
    EXPECT_TRUE(second.cache_hit);
    EXPECT_EQ(embedder_->calls(), 1u);
}
