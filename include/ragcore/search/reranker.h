#pragma once

#include <ragcore/core/types.h>
#include <ragcore/search/retrieval_candidate.h>

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ragcore::search {

/**
 * Configuration for the secondary ranking pass
 */
struct RerankerConfig {
    size_t top_n = 40; // Hybrid-ranked candidates considered

    // Signal weights; rescaled to sum to 1.0
    double combined_weight = 0.6;
    double keyword_weight = 0.2;
    double position_weight = 0.1;
    double length_weight = 0.1;

    double position_decay = 0.05;  // position score = 1 / (1 + decay * chunk_index)
    size_t ideal_min_chars = 200;  // Passages inside [min, max] get no length penalty
    size_t ideal_max_chars = 1000;

    Result<void> validate() const;
};

/**
 * @brief Reorders the top hybrid-ranked candidates using signals beyond the combined score.
 *
 * rerank_score mixes the combined score with the exact keyword overlap ratio between the
 * query and the passage, the passage position within its source document, and a penalty
 * for passages outside the ideal length range. Output is sorted by rerank_score descending
 * with ties broken by (filename, chunk_index) ascending.
 */
class Reranker {
public:
    explicit Reranker(RerankerConfig config = {});

    std::vector<RetrievalCandidate> rerank(std::string_view query,
                                           std::vector<RetrievalCandidate> ranked,
                                           size_t* droppedMalformed = nullptr) const;

    /**
     * @brief Fraction of unique query tokens present in text; 0 for an empty query.
     */
    static double keywordOverlap(const std::unordered_set<std::string>& queryTokens,
                                 std::string_view text);

    double positionScore(size_t chunkIndex) const;
    double lengthScore(size_t charLength) const;

    const RerankerConfig& config() const { return config_; }

private:
    RerankerConfig config_;
};

} // namespace ragcore::search
