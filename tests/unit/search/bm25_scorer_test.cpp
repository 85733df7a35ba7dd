#include <gtest/gtest.h>
#include <ragcore/search/bm25_scorer.h>
#include <ragcore/search/tokenizer.h>

#include <cmath>
#include <string>
#include <vector>

using namespace ragcore::search;

class Bm25ScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scorer_.addChunk("1:0", "apple banana");
        scorer_.addChunk("1:1", "apple cherry");
        scorer_.addChunk("2:0", "durian");
    }

    Bm25Scorer scorer_;
};

TEST_F(Bm25ScorerTest, TokenizerLowercasesAndKeepsUtf8Words) {
    auto tokens = tokenize("Hello, WORLD! Caf\xC3\xA9-bar 42x");
    std::vector<std::string> expected = {"hello", "world", "caf\xC3\xA9", "bar", "42x"};
    EXPECT_EQ(tokens, expected);
    EXPECT_TRUE(tokenize("  ,.;  ").empty());
}

TEST_F(Bm25ScorerTest, CorpusStatistics) {
    EXPECT_EQ(scorer_.chunkCount(), 3u);
    EXPECT_EQ(scorer_.documentFrequency("apple"), 2u);
    EXPECT_EQ(scorer_.documentFrequency("durian"), 1u);
    EXPECT_EQ(scorer_.documentFrequency("mango"), 0u);
    EXPECT_NEAR(scorer_.averageChunkLength(), 5.0 / 3.0, 1e-12);
}

TEST_F(Bm25ScorerTest, ScoreMatchesFormula) {
    const double k1 = 1.5;
    const double b = 0.75;
    const double idf = std::log(1.0 + (3.0 - 2.0 + 0.5) / (2.0 + 0.5));
    const double norm = 1.0 + k1 * (1.0 - b + b * 2.0 / (5.0 / 3.0));
    const double expected = idf * (1.0 * (k1 + 1.0)) / norm;

    EXPECT_NEAR(scorer_.score("apple", "apple banana"), expected, 1e-12);
    EXPECT_NEAR(scorer_.idf("apple"), idf, 1e-12);
}

TEST_F(Bm25ScorerTest, RareTermsOutweighCommonOnes) {
    EXPECT_GT(scorer_.idf("durian"), scorer_.idf("apple"));
    EXPECT_GT(scorer_.idf("never-seen"), 0.0);
    EXPECT_GT(scorer_.score("banana", "apple banana"), scorer_.score("apple", "apple banana"));
}

TEST_F(Bm25ScorerTest, NoMatchingTermScoresExactlyZero) {
    EXPECT_EQ(scorer_.score("security diensten", "apple banana"), 0.0);
    EXPECT_EQ(scorer_.score("", "apple banana"), 0.0);
    EXPECT_EQ(scorer_.score("apple", ""), 0.0);
}

TEST_F(Bm25ScorerTest, LongerChunksScoreLowerForSameFrequency) {
    double shortScore = scorer_.score("cherry", "cherry pie");
    double longScore = scorer_.score("cherry", "cherry pie with a lot of extra filler words here");
    EXPECT_GT(shortScore, longScore);
    EXPECT_GT(longScore, 0.0);
}

TEST_F(Bm25ScorerTest, ScoreAllUsesOneSnapshot) {
    std::vector<std::string_view> texts = {"apple banana", "durian", "nothing relevant"};
    auto scores = scorer_.scoreAll("apple durian", texts);
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_DOUBLE_EQ(scores[0], scorer_.score("apple durian", "apple banana"));
    EXPECT_DOUBLE_EQ(scores[1], scorer_.score("apple durian", "durian"));
    EXPECT_EQ(scores[2], 0.0);
}

TEST_F(Bm25ScorerTest, RemovingChunksUpdatesStatistics) {
    EXPECT_TRUE(scorer_.removeChunk("1:1"));
    EXPECT_FALSE(scorer_.removeChunk("1:1"));
    EXPECT_EQ(scorer_.documentFrequency("apple"), 1u);
    EXPECT_EQ(scorer_.documentFrequency("cherry"), 0u);
    EXPECT_EQ(scorer_.chunkCount(), 2u);
}

TEST_F(Bm25ScorerTest, RemoveDocumentOnlyTouchesItsChunks) {
    scorer_.addChunk("10:0", "apple tart");
    EXPECT_EQ(scorer_.removeDocument(1), 2u);
    EXPECT_EQ(scorer_.chunkCount(), 2u);
    EXPECT_EQ(scorer_.documentFrequency("apple"), 1u);
    EXPECT_EQ(scorer_.documentFrequency("durian"), 1u);
}

TEST_F(Bm25ScorerTest, ReAddingChunkReplacesIt) {
    scorer_.addChunk("2:0", "apple");
    EXPECT_EQ(scorer_.chunkCount(), 3u);
    EXPECT_EQ(scorer_.documentFrequency("apple"), 3u);
    EXPECT_EQ(scorer_.documentFrequency("durian"), 0u);
}

TEST_F(Bm25ScorerTest, JaccardSimilarity) {
    auto a = tokenSet("the quick brown fox");
    auto b = tokenSet("the quick red fox");
    EXPECT_NEAR(jaccardSimilarity(a, b), 3.0 / 5.0, 1e-12);
    EXPECT_EQ(jaccardSimilarity(a, a), 1.0);
    EXPECT_EQ(jaccardSimilarity({}, {}), 0.0);
}

TEST(Bm25ConfigTest, Validation) {
    Bm25Config cfg;
    EXPECT_TRUE(cfg.validate());
    cfg.k1 = 0.0;
    EXPECT_FALSE(cfg.validate());
    cfg = Bm25Config{};
    cfg.b = 1.5;
    EXPECT_FALSE(cfg.validate());
}
