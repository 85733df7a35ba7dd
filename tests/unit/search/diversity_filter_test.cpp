#include <gtest/gtest.h>
#include <ragcore/search/diversity_filter.h>

#include <cctype>
#include <cstdlib>
#include <set>
#include <string>
#include <vector>

using namespace ragcore::search;

namespace {
// Texts built from per-candidate words stay far below any Jaccard threshold
std::string distinctText(const std::string& rawTag) {
    std::string tag;
    for (char c : rawTag) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            tag.push_back(c);
        }
    }
    return tag + "alpha " + tag + "beta " + tag + "gamma shared";
}

RetrievalCandidate makeCandidate(const std::string& file, size_t index, std::string text = {}) {
    RetrievalCandidate c;
    c.filename = file;
    c.chunk_index = index;
    c.chunk_id = file + ":" + std::to_string(index);
    c.text = text.empty() ? distinctText(file + std::to_string(index)) : std::move(text);
    return c;
}
} // namespace

class DiversityFilterTest : public ::testing::Test {
protected:
    DiversityConfig config_;
};

TEST_F(DiversityFilterTest, ConsecutiveOverlappingChunksCollapseToOne) {
    // Four neighbouring chunks of one report dominate the top of a 60-candidate pool
    std::vector<RetrievalCandidate> ranked;
    for (size_t idx = 10; idx <= 13; ++idx) {
        ranked.push_back(makeCandidate("report.pdf", idx));
    }
    for (int i = 0; i < 56; ++i) {
        ranked.push_back(makeCandidate("doc_" + std::to_string(i) + ".txt", 0));
    }

    DiversityFilter filter(config_);
    DiversityStats stats;
    auto out = filter.filter(ranked, &stats);

    ASSERT_EQ(out.size(), config_.final_top_k);
    EXPECT_EQ(out[0].filename, "report.pdf");
    EXPECT_EQ(out[0].chunk_index, 10u);
    for (size_t i = 1; i < out.size(); ++i) {
        EXPECT_NE(out[i].filename, "report.pdf");
    }
    EXPECT_EQ(stats.adjacent, 3u);
}

TEST_F(DiversityFilterTest, RejectedNeighbourKeepsBlockingItsOwnWindow) {
    // 14 is four chunks from the accepted 10, but within the window of the rejected 12
    config_.adjacency_window = 2;
    std::vector<RetrievalCandidate> ranked = {makeCandidate("manual.pdf", 10),
                                              makeCandidate("manual.pdf", 12),
                                              makeCandidate("manual.pdf", 14),
                                              makeCandidate("manual.pdf", 17)};

    DiversityFilter filter(config_);
    DiversityStats stats;
    auto out = filter.filter(ranked, &stats);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].chunk_index, 10u);
    EXPECT_EQ(out[1].chunk_index, 17u);
    EXPECT_EQ(stats.adjacent, 2u);
}

TEST_F(DiversityFilterTest, DistantChunksOfSameFileAreKept) {
    DiversityFilter filter(config_);
    auto out = filter.filter({makeCandidate("a.txt", 10), makeCandidate("a.txt", 13),
                              makeCandidate("a.txt", 7)});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[1].chunk_index, 13u);
    EXPECT_EQ(out[2].chunk_index, 7u);
}

TEST_F(DiversityFilterTest, AdjacencyWindowIsInclusive) {
    DiversityFilter filter(config_);
    DiversityStats stats;
    auto out = filter.filter({makeCandidate("a.txt", 5), makeCandidate("a.txt", 3),
                              makeCandidate("b.txt", 4)},
                             &stats);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].filename, "b.txt");
    EXPECT_EQ(stats.adjacent, 1u);
}

TEST_F(DiversityFilterTest, DuplicateKeysAreRejected) {
    config_.adjacency_window = 0;
    DiversityFilter filter(config_);
    DiversityStats stats;
    auto out = filter.filter({makeCandidate("a.txt", 1), makeCandidate("a.txt", 1),
                              makeCandidate("a.txt", 2)},
                             &stats);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(stats.duplicate, 1u);
}

TEST_F(DiversityFilterTest, NearDuplicateTextAcrossFilesIsRejected) {
    DiversityFilter filter(config_);
    DiversityStats stats;
    auto out = filter.filter({makeCandidate("a.txt", 0, "one two three"),
                              makeCandidate("b.txt", 0, "one two three four"),
                              makeCandidate("c.txt", 0, "one two five")},
                             &stats);
    // {one,two,three} vs {one,two,three,four} = 0.75; vs {one,two,five} = 0.5 (not above)
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].filename, "a.txt");
    EXPECT_EQ(out[1].filename, "c.txt");
    EXPECT_EQ(stats.similar, 1u);
}

TEST_F(DiversityFilterTest, StopsAtFinalTopK) {
    config_.final_top_k = 2;
    DiversityFilter filter(config_);
    auto out = filter.filter({makeCandidate("a.txt", 0), makeCandidate("b.txt", 0),
                              makeCandidate("c.txt", 0)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].filename, "b.txt");
}

TEST_F(DiversityFilterTest, OutputSatisfiesDedupInvariant) {
    std::vector<RetrievalCandidate> ranked;
    unsigned seed = 7;
    for (int i = 0; i < 60; ++i) {
        seed = seed * 1103515245u + 12345u;
        std::string file = "f" + std::to_string((seed >> 8) % 4) + ".txt";
        size_t index = (seed >> 16) % 25;
        ranked.push_back(makeCandidate(file, index, distinctText("t" + std::to_string(i))));
    }
    config_.final_top_k = 50;
    DiversityFilter filter(config_);
    auto out = filter.filter(ranked);

    std::set<std::pair<std::string, size_t>> keys;
    for (size_t i = 0; i < out.size(); ++i) {
        EXPECT_TRUE(keys.emplace(out[i].filename, out[i].chunk_index).second);
        for (size_t j = 0; j < i; ++j) {
            if (out[i].filename == out[j].filename) {
                long delta = static_cast<long>(out[i].chunk_index) -
                             static_cast<long>(out[j].chunk_index);
                EXPECT_GT(std::labs(delta), static_cast<long>(config_.adjacency_window));
            }
        }
    }
}

TEST_F(DiversityFilterTest, ConfigValidation) {
    EXPECT_TRUE(config_.validate());
    DiversityConfig cfg;
    cfg.final_top_k = 0;
    EXPECT_FALSE(cfg.validate());
    cfg = DiversityConfig{};
    cfg.diversity_threshold = 1.2;
    EXPECT_FALSE(cfg.validate());
}
