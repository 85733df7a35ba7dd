#include <gtest/gtest.h>
#include <ragcore/search/reranker.h>
#include <ragcore/search/tokenizer.h>

#include <string>
#include <vector>

using namespace ragcore::search;

namespace {
std::string padTo(std::string text, size_t length) {
    while (text.size() < length) {
        text += " lorem";
    }
    return text.substr(0, length);
}

RetrievalCandidate makeCandidate(const std::string& file, size_t index, double combined,
                                 std::string text) {
    RetrievalCandidate c;
    c.filename = file;
    c.chunk_index = index;
    c.chunk_id = file + ":" + std::to_string(index);
    c.combined_score = combined;
    c.similarity_score = combined;
    c.text = std::move(text);
    return c;
}
} // namespace

class RerankerTest : public ::testing::Test {
protected:
    RerankerConfig config_;
};

TEST_F(RerankerTest, KeywordOverlapRatio) {
    auto query = tokenSet("vector search engine");
    EXPECT_NEAR(Reranker::keywordOverlap(query, "A search ENGINE for text"), 2.0 / 3.0, 1e-12);
    EXPECT_EQ(Reranker::keywordOverlap(query, "nothing here"), 0.0);
    EXPECT_EQ(Reranker::keywordOverlap({}, "search"), 0.0);
}

TEST_F(RerankerTest, PositionAndLengthSignals) {
    Reranker reranker(config_);
    EXPECT_DOUBLE_EQ(reranker.positionScore(0), 1.0);
    EXPECT_DOUBLE_EQ(reranker.positionScore(20), 0.5);
    EXPECT_GT(reranker.positionScore(3), reranker.positionScore(4));

    EXPECT_DOUBLE_EQ(reranker.lengthScore(500), 1.0);
    EXPECT_DOUBLE_EQ(reranker.lengthScore(100), 0.5);
    EXPECT_DOUBLE_EQ(reranker.lengthScore(2000), 0.5);
}

TEST_F(RerankerTest, KeywordMatchCanOvertakeHigherCombinedScore) {
    Reranker reranker(config_);
    auto out = reranker.rerank(
        "invoice retention policy",
        {makeCandidate("a.txt", 0, 0.55, padTo("general background material", 300)),
         makeCandidate("b.txt", 0, 0.50, padTo("the invoice retention policy says", 300))});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].filename, "b.txt");
    EXPECT_NEAR(out[0].rerank_score, 0.6 * 0.5 + 0.2 + 0.1 + 0.1, 1e-9);
    EXPECT_NEAR(out[1].rerank_score, 0.6 * 0.55 + 0.1 + 0.1, 1e-9);
}

TEST_F(RerankerTest, OnlyTopNAreKept) {
    config_.top_n = 3;
    Reranker reranker(config_);
    std::vector<RetrievalCandidate> ranked;
    for (size_t i = 0; i < 10; ++i) {
        ranked.push_back(makeCandidate("f" + std::to_string(i) + ".txt", 0, 1.0 - 0.05 * i,
                                       padTo("text", 300)));
    }
    auto out = reranker.rerank("query", ranked);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].filename, "f0.txt");
    EXPECT_EQ(out[2].filename, "f2.txt");
}

TEST_F(RerankerTest, EqualScoresOrderByFilenameThenIndex) {
    Reranker reranker(config_);
    const std::string text = padTo("identical text", 300);
    auto out = reranker.rerank("zzz", {makeCandidate("c.txt", 0, 0.5, text),
                                       makeCandidate("a.txt", 0, 0.5, text),
                                       makeCandidate("b.txt", 0, 0.5, text)});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].filename, "a.txt");
    EXPECT_EQ(out[1].filename, "b.txt");
    EXPECT_EQ(out[2].filename, "c.txt");
}

TEST_F(RerankerTest, OutputIsSortedDescending) {
    Reranker reranker(config_);
    std::vector<RetrievalCandidate> ranked;
    for (size_t i = 0; i < 12; ++i) {
        ranked.push_back(makeCandidate("doc.txt", i * 3, 0.1 * static_cast<double>(i % 5),
                                       padTo("retrieval chunk", 150 + 40 * i)));
    }
    auto out = reranker.rerank("retrieval", ranked);
    ASSERT_EQ(out.size(), 12u);
    for (size_t i = 1; i < out.size(); ++i) {
        EXPECT_GE(out[i - 1].rerank_score, out[i].rerank_score);
    }
}

TEST_F(RerankerTest, ConfigValidation) {
    EXPECT_TRUE(config_.validate());
    RerankerConfig cfg;
    cfg.top_n = 0;
    EXPECT_FALSE(cfg.validate());
    cfg = RerankerConfig{};
    cfg.top_n = 201;
    EXPECT_FALSE(cfg.validate());
    cfg = RerankerConfig{};
    cfg.keyword_weight = -0.1;
    EXPECT_FALSE(cfg.validate());
    cfg = RerankerConfig{};
    cfg.ideal_min_chars = 2000;
    EXPECT_FALSE(cfg.validate());
}
