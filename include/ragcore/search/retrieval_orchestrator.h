#pragma once

#include <ragcore/cache/embedding_cache.h>
#include <ragcore/cache/query_result_cache.h>
#include <ragcore/core/document.h>
#include <ragcore/core/types.h>
#include <ragcore/search/bm25_scorer.h>
#include <ragcore/search/diversity_filter.h>
#include <ragcore/search/hybrid_ranker.h>
#include <ragcore/search/reranker.h>
#include <ragcore/search/retrieval_candidate.h>
#include <ragcore/storage/document_store.h>
#include <ragcore/vector/embedder.h>
#include <ragcore/vector/vector_store.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragcore::search {

struct OrchestratorConfig {
    size_t candidate_pool_size = 60; ///< Matches requested from the vector store
    std::chrono::milliseconds request_timeout{30000};
    size_t worker_threads = 4; ///< Threads running deadline-bounded stages
    bool cache_results = true;

    Result<void> validate() const;
};

/**
 * @brief Collaborators of a RetrievalOrchestrator. Caches are optional.
 */
struct RetrievalComponents {
    std::shared_ptr<vector::IEmbedder> embedder;
    std::shared_ptr<vector::IVectorStore> vectors;
    std::shared_ptr<storage::IDocumentStore> documents;
    std::shared_ptr<Bm25Scorer> bm25;
    std::shared_ptr<cache::EmbeddingCache> embeddingCache;
    std::shared_ptr<cache::QueryResultCache> queryCache;
};

struct RetrievalOptions {
    std::optional<vector::VectorFilter> filter;
    std::optional<std::chrono::milliseconds> timeout; ///< Overrides request_timeout
    bool bypass_cache = false;                        ///< Neither read nor write cached results
};

/**
 * @brief A result passage with its neighbouring chunks, in chunk order.
 */
struct ExpandedPassage {
    RetrievalCandidate hit;
    std::vector<Chunk> context; ///< Includes the hit itself
};

/**
 * @brief Runs one retrieval request end to end.
 *
 * Stages: EmbedQuery -> CandidateSearch -> ScoreMerge -> Rerank -> Dedup -> Return. The first
 * two call external services on the worker pool and are awaited against the request deadline;
 * a miss fails the whole request with SearchTimeout. Their failures are fatal
 * (EmbeddingUnavailable, VectorStoreUnavailable). Later stages drop malformed candidates
 * individually and always complete.
 *
 * A stage that misses its deadline keeps its worker until the collaborator call returns.
 * While such abandoned stages hold every worker, new requests fail at once with
 * ResourceExhausted instead of queueing behind them. Destruction waits for calls still
 * running.
 *
 * Results are cached per normalized query, filter and ranking configuration. Concurrent
 * calls are independent.
 */
class RetrievalOrchestrator {
public:
    RetrievalOrchestrator(OrchestratorConfig config, HybridRankerConfig hybrid,
                          RerankerConfig rerank, DiversityConfig diversity,
                          RetrievalComponents components);
    ~RetrievalOrchestrator();

    RetrievalOrchestrator(const RetrievalOrchestrator&) = delete;
    RetrievalOrchestrator& operator=(const RetrievalOrchestrator&) = delete;

    Result<RetrievalResult> retrieve(std::string_view query, const RetrievalOptions& options = {});

    /**
     * @brief Fetch up to window chunks on each side of every result passage.
     */
    Result<std::vector<ExpandedPassage>> expandContext(const RetrievalResult& result,
                                                       size_t window) const;

    /**
     * @brief Collapse whitespace runs to one space and trim.
     */
    static std::string normalizeQuery(std::string_view query);

    /**
     * @brief Text describing every parameter that affects ranking; part of result cache keys.
     */
    std::string rankingFingerprint() const;

    const OrchestratorConfig& config() const { return config_; }

    // Stages past their deadline whose collaborator call has not returned yet
    size_t abandonedStages() const { return abandoned_->load(); }

private:
    using Deadline = std::chrono::steady_clock::time_point;

    template <typename T, typename Fn>
    Result<T> runStage(RetrievalStage stage, Deadline deadline, ErrorCode failureCode, Fn fn);

    Result<Embedding> embedQuery(const std::string& query, Deadline deadline,
                                 RetrievalTrace& trace);
    Result<std::vector<vector::VectorMatch>> searchCandidates(const Embedding& embedding,
                                                              const RetrievalOptions& options,
                                                              Deadline deadline);
    std::vector<RetrievalCandidate> hydrate(const std::vector<vector::VectorMatch>& matches,
                                            RetrievalTrace& trace) const;

    OrchestratorConfig config_;
    HybridRanker hybrid_;
    Reranker reranker_;
    DiversityFilter diversity_;
    RetrievalComponents components_;
    std::shared_ptr<std::atomic<size_t>> abandoned_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace ragcore::search
