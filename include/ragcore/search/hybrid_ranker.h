#pragma once

#include <ragcore/core/types.h>
#include <ragcore/search/retrieval_candidate.h>

#include <vector>

namespace ragcore::search {

/**
 * Configuration for merging semantic and keyword scores
 */
struct HybridRankerConfig {
    double semantic_weight = 0.7;
    double bm25_weight = 0.3;
    double min_similarity = 0.25; // Candidates below are discarded before ranking

    // Rescale weights so they sum to 1.0
    void normalizeWeights() {
        double sum = semantic_weight + bm25_weight;
        if (sum > 0) {
            semantic_weight /= sum;
            bm25_weight /= sum;
        }
    }

    Result<void> validate() const;
};

struct HybridRankStats {
    size_t dropped_malformed = 0;
    size_t dropped_below_threshold = 0;
};

/**
 * @brief Merges vector similarity and BM25 into combined_score.
 *
 * Both signals are min-max normalized over the current pool before weighting, so their
 * absolute scales do not matter. A signal that is constant across the pool normalizes to
 * 1.0 when positive and 0.0 otherwise. Malformed candidates (non-finite scores, negative
 * BM25, empty text) are logged and dropped.
 */
class HybridRanker {
public:
    explicit HybridRanker(HybridRankerConfig config = {});

    /**
     * @brief Filter, score and sort candidates by combined_score descending.
     *
     * Ties are broken by (filename, chunk_index) ascending.
     */
    std::vector<RetrievalCandidate> rank(std::vector<RetrievalCandidate> candidates,
                                         HybridRankStats* stats = nullptr) const;

    const HybridRankerConfig& config() const { return config_; }

private:
    HybridRankerConfig config_;
};

/**
 * @brief Map a cosine similarity in [-1, 1] to [0, 1]; negative similarity becomes 0.
 */
double normalizeCosine(double cosine);

/**
 * @brief Validate a candidate's fields before scoring.
 * @return MalformedCandidate describing the first problem found
 */
Result<void> checkCandidate(const RetrievalCandidate& candidate);

} // namespace ragcore::search
