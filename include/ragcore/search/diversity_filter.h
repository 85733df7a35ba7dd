#pragma once

#include <ragcore/core/types.h>
#include <ragcore/search/retrieval_candidate.h>

#include <vector>

namespace ragcore::search {

struct DiversityConfig {
    size_t final_top_k = 6;           // Results returned
    size_t adjacency_window = 2;      // Same-file chunks within this index distance are rejected
    double diversity_threshold = 0.5; // Token Jaccard above this counts as a near duplicate

    Result<void> validate() const;
};

/**
 * Why a candidate was not accepted
 */
enum class RejectReason { Duplicate, Adjacent, Similar };

struct DiversityStats {
    size_t duplicate = 0;
    size_t adjacent = 0;
    size_t similar = 0;
};

/**
 * @brief Removes near-duplicate and overlap-adjacent passages from a reranked list.
 *
 * Walks candidates in order and rejects one if its (filename, chunk_index) was already
 * accepted, if an accepted chunk of the same file lies within adjacency_window indices,
 * or if its token Jaccard similarity with any accepted passage exceeds
 * diversity_threshold. Chunks rejected for adjacency extend the blocked range of their
 * file, so a run of consecutive overlapping chunks yields only its best-ranked member.
 * Stops after final_top_k acceptances. Input order is preserved.
 */
class DiversityFilter {
public:
    explicit DiversityFilter(DiversityConfig config = {});

    std::vector<RetrievalCandidate> filter(const std::vector<RetrievalCandidate>& ranked,
                                           DiversityStats* stats = nullptr) const;

    const DiversityConfig& config() const { return config_; }

private:
    DiversityConfig config_;
};

} // namespace ragcore::search
