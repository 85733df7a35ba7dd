#pragma once

#include <ragcore/core/types.h>

#include <chrono>
#include <string>
#include <vector>

namespace ragcore::search {

/**
 * @brief A chunk under consideration for a query, with every score computed so far.
 */
struct RetrievalCandidate {
    std::string chunk_id;
    DocumentId document_id = 0;
    std::string filename;
    size_t chunk_index = 0;
    std::string text;

    double similarity_score = 0.0; // cosine, normalized to [0, 1]
    double bm25_score = 0.0;       // >= 0
    double combined_score = 0.0;
    double rerank_score = 0.0;
};

/**
 * @brief Deterministic tie-break: (filename, chunk_index) ascending.
 */
inline bool candidateKeyLess(const RetrievalCandidate& a, const RetrievalCandidate& b) {
    if (a.filename != b.filename) {
        return a.filename < b.filename;
    }
    return a.chunk_index < b.chunk_index;
}

/**
 * Pipeline stages of a retrieval request, in execution order
 */
enum class RetrievalStage { EmbedQuery, CandidateSearch, ScoreMerge, Rerank, Dedup, Return };

const char* stageToString(RetrievalStage stage);

/**
 * @brief Per-request diagnostics
 */
struct RetrievalTrace {
    std::chrono::microseconds embed_time{0};
    std::chrono::microseconds search_time{0};
    std::chrono::microseconds rank_time{0};
    bool embedding_cache_hit = false;
    size_t candidates_found = 0;
    size_t dropped_malformed = 0;
    size_t dropped_below_threshold = 0;
    size_t rejected_duplicate = 0;
    size_t rejected_adjacent = 0;
    size_t rejected_similar = 0;
};

/**
 * @brief Ordered, deduplicated result of one retrieval request.
 */
struct RetrievalResult {
    std::vector<RetrievalCandidate> candidates;
    bool from_cache = false;
    RetrievalTrace trace;

    [[nodiscard]] bool empty() const noexcept { return candidates.empty(); }
    [[nodiscard]] size_t size() const noexcept { return candidates.size(); }
};

} // namespace ragcore::search
