#include <ragcore/search/retrieval_orchestrator.h>

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <future>

namespace ragcore::search {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

} // namespace

const char* stageToString(RetrievalStage stage) {
    switch (stage) {
        case RetrievalStage::EmbedQuery:
            return "EMBED_QUERY";
        case RetrievalStage::CandidateSearch:
            return "CANDIDATE_SEARCH";
        case RetrievalStage::ScoreMerge:
            return "SCORE_MERGE";
        case RetrievalStage::Rerank:
            return "RERANK";
        case RetrievalStage::Dedup:
            return "DEDUP";
        case RetrievalStage::Return:
            return "RETURN";
    }
    return "UNKNOWN";
}

Result<void> OrchestratorConfig::validate() const {
    if (candidate_pool_size == 0 || candidate_pool_size > 10000) {
        return Error{ErrorCode::ValidationError, "candidate_pool_size must be in 1..10000"};
    }
    if (request_timeout.count() <= 0) {
        return Error{ErrorCode::ValidationError, "request_timeout must be positive"};
    }
    if (worker_threads == 0) {
        return Error{ErrorCode::ValidationError, "worker_threads must be positive"};
    }
    return {};
}

RetrievalOrchestrator::RetrievalOrchestrator(OrchestratorConfig config, HybridRankerConfig hybrid,
                                             RerankerConfig rerank, DiversityConfig diversity,
                                             RetrievalComponents components)
    : config_(config), hybrid_(hybrid), reranker_(rerank), diversity_(diversity),
      components_(std::move(components)), abandoned_(std::make_shared<std::atomic<size_t>>(0)),
      pool_(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(1, config.worker_threads))) {
}

RetrievalOrchestrator::~RetrievalOrchestrator() {
    // Queued stages nobody waits for are dropped; running ones are waited for
    pool_->stop();
    pool_->join();
}

std::string RetrievalOrchestrator::normalizeQuery(std::string_view query) {
    std::string out;
    out.reserve(query.size());
    bool pendingSpace = false;
    for (char c : query) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string RetrievalOrchestrator::rankingFingerprint() const {
    const auto& h = hybrid_.config();
    const auto& r = reranker_.config();
    const auto& d = diversity_.config();
    std::string model = components_.embedder ? components_.embedder->modelName() : "";
    std::string bm25;
    if (components_.bm25) {
        bm25 = fmt::format("{:.4f}/{:.4f}", components_.bm25->config().k1,
                           components_.bm25->config().b);
    }
    return fmt::format("model={};pool={};sem={:.6f};kw={:.6f};min={:.6f};bm25={};"
                       "rr={}/{:.4f}/{:.4f}/{:.4f}/{:.4f}/{:.4f}/{}/{};div={}/{}/{:.4f}",
                       model, config_.candidate_pool_size, h.semantic_weight, h.bm25_weight,
                       h.min_similarity, bm25, r.top_n, r.combined_weight, r.keyword_weight,
                       r.position_weight, r.length_weight, r.position_decay, r.ideal_min_chars,
                       r.ideal_max_chars, d.final_top_k, d.adjacency_window,
                       d.diversity_threshold);
}

template <typename T, typename Fn>
Result<T> RetrievalOrchestrator::runStage(RetrievalStage stage, Deadline deadline,
                                          ErrorCode failureCode, Fn fn) {
    auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return Error{ErrorCode::SearchTimeout,
                     fmt::format("request deadline passed before {}", stageToString(stage))};
    }

    const size_t workers = std::max<size_t>(1, config_.worker_threads);
    if (const size_t stuck = abandoned_->load(); stuck >= workers) {
        return Error{ErrorCode::ResourceExhausted,
                     fmt::format("{} skipped: all {} workers are held by {} abandoned stages",
                                 stageToString(stage), workers, stuck)};
    }

    // Running -> Finished by the task, Running -> Abandoned by the waiter; whichever loses
    // the exchange knows the other side already acted
    enum : int { kRunning = 0, kFinished = 1, kAbandoned = 2 };
    auto state = std::make_shared<std::atomic<int>>(kRunning);

    // The task owns everything it touches, so abandoning it on timeout is safe
    std::future<Result<T>> future = boost::asio::post(
        *pool_, boost::asio::use_future([fn = std::move(fn), failureCode, stage, state,
                                         abandoned = abandoned_]() -> Result<T> {
            struct Settle {
                std::atomic<int>& state;
                std::atomic<size_t>& abandoned;
                ~Settle() {
                    int expected = kRunning;
                    if (!state.compare_exchange_strong(expected, kFinished)) {
                        abandoned.fetch_sub(1);
                    }
                }
            } settle{*state, *abandoned};
            try {
                return fn();
            } catch (const std::exception& e) {
                return Error{failureCode,
                             fmt::format("{} threw: {}", stageToString(stage), e.what())};
            }
        }));

    if (future.wait_for(remaining) != std::future_status::ready) {
        // Counted before the exchange so the task's decrement can never run first
        abandoned_->fetch_add(1);
        int expected = kRunning;
        if (state->compare_exchange_strong(expected, kAbandoned)) {
            spdlog::warn("{} exceeded the request deadline", stageToString(stage));
            return Error{ErrorCode::SearchTimeout,
                         fmt::format("{} exceeded the request deadline", stageToString(stage))};
        }
        // The task settled between the timed wait and the exchange
        abandoned_->fetch_sub(1);
        future.wait();
    }
    return future.get();
}

Result<Embedding> RetrievalOrchestrator::embedQuery(const std::string& query, Deadline deadline,
                                                    RetrievalTrace& trace) {
    auto embedder = components_.embedder;
    if (!embedder) {
        return Error{ErrorCode::EmbeddingUnavailable, "no embedder configured"};
    }
    const auto model = embedder->modelName();
    const auto dimension = embedder->dimension();

    if (components_.embeddingCache) {
        if (auto cached = components_.embeddingCache->get(model, query, dimension)) {
            trace.embedding_cache_hit = true;
            spdlog::debug("Query embedding served from cache");
            return std::move(*cached);
        }
    }

    auto embedded = runStage<Embedding>(
        RetrievalStage::EmbedQuery, deadline, ErrorCode::EmbeddingUnavailable,
        [embedder, query, dimension]() -> Result<Embedding> {
            auto result = embedder->embed(query);
            if (!result) {
                return Error{ErrorCode::EmbeddingUnavailable, result.error().message};
            }
            const auto& vec = result.value();
            if (vec.empty() || (dimension != 0 && vec.size() != dimension)) {
                return Error{ErrorCode::EmbeddingUnavailable,
                             fmt::format("embedder returned {} values, expected {}", vec.size(),
                                         dimension)};
            }
            if (!std::all_of(vec.begin(), vec.end(), [](float v) { return std::isfinite(v); })) {
                return Error{ErrorCode::EmbeddingUnavailable,
                             "embedder returned non-finite values"};
            }
            return result;
        });
    if (!embedded) {
        return embedded;
    }
    if (components_.embeddingCache) {
        components_.embeddingCache->put(model, query, embedded.value());
    }
    return embedded;
}

Result<std::vector<vector::VectorMatch>>
RetrievalOrchestrator::searchCandidates(const Embedding& embedding,
                                        const RetrievalOptions& options, Deadline deadline) {
    auto vectors = components_.vectors;
    if (!vectors) {
        return Error{ErrorCode::VectorStoreUnavailable, "no vector store configured"};
    }
    const size_t topK = config_.candidate_pool_size;
    return runStage<std::vector<vector::VectorMatch>>(
        RetrievalStage::CandidateSearch, deadline, ErrorCode::VectorStoreUnavailable,
        [vectors, embedding, topK,
         filter = options.filter]() -> Result<std::vector<vector::VectorMatch>> {
            auto result = vectors->search(embedding, topK, filter ? &*filter : nullptr);
            if (!result) {
                return Error{ErrorCode::VectorStoreUnavailable, result.error().message};
            }
            return result;
        });
}

std::vector<RetrievalCandidate>
RetrievalOrchestrator::hydrate(const std::vector<vector::VectorMatch>& matches,
                               RetrievalTrace& trace) const {
    std::vector<RetrievalCandidate> candidates;
    candidates.reserve(matches.size());
    for (const auto& match : matches) {
        auto chunk = components_.documents->getChunk(match.chunk_id);
        if (!chunk || !chunk.value()) {
            spdlog::warn("Dropping candidate {}: {}", match.chunk_id,
                         chunk ? std::string("chunk not found") : chunk.error().message);
            ++trace.dropped_malformed;
            continue;
        }
        const auto& c = *chunk.value();
        RetrievalCandidate candidate;
        candidate.chunk_id = match.chunk_id;
        candidate.document_id = c.document_id;
        candidate.filename = c.filename;
        candidate.chunk_index = c.chunk_index;
        candidate.text = c.text;
        candidate.similarity_score = normalizeCosine(match.similarity);
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

Result<RetrievalResult> RetrievalOrchestrator::retrieve(std::string_view query,
                                                        const RetrievalOptions& options) {
    const auto normalized = normalizeQuery(query);
    if (normalized.empty()) {
        return Error{ErrorCode::InvalidArgument, "query must not be empty"};
    }
    if (!components_.documents || !components_.bm25) {
        return Error{ErrorCode::NotInitialized, "retrieval orchestrator is missing a collaborator"};
    }

    const auto deadline = Clock::now() + options.timeout.value_or(config_.request_timeout);
    const bool useCache = config_.cache_results && components_.queryCache && !options.bypass_cache;

    std::string cacheKey;
    if (useCache) {
        auto scope = (options.filter ? options.filter->signature() : std::string{}) + "|" +
                     rankingFingerprint();
        cacheKey = cache::QueryResultCache::makeKey(normalized, scope);
        if (auto cached = components_.queryCache->get(cacheKey)) {
            spdlog::debug("Query result served from cache ({} passages)", cached->size());
            return std::move(*cached);
        }
    }

    RetrievalResult result;
    auto& trace = result.trace;

    spdlog::debug("{}: '{}'", stageToString(RetrievalStage::EmbedQuery), normalized);
    auto stageStart = Clock::now();
    auto embedding = embedQuery(normalized, deadline, trace);
    trace.embed_time = elapsedSince(stageStart);
    if (!embedding) {
        return embedding.error();
    }

    spdlog::debug("{}: pool {}", stageToString(RetrievalStage::CandidateSearch),
                  config_.candidate_pool_size);
    stageStart = Clock::now();
    auto matches = searchCandidates(embedding.value(), options, deadline);
    trace.search_time = elapsedSince(stageStart);
    if (!matches) {
        return matches.error();
    }
    trace.candidates_found = matches.value().size();

    stageStart = Clock::now();
    spdlog::debug("{}: {} matches", stageToString(RetrievalStage::ScoreMerge),
                  trace.candidates_found);
    auto candidates = hydrate(matches.value(), trace);

    std::vector<std::string_view> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates) {
        texts.emplace_back(c.text);
    }
    auto bm25Scores = components_.bm25->scoreAll(normalized, texts);
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].bm25_score = bm25Scores[i];
    }

    HybridRankStats hybridStats;
    auto ranked = hybrid_.rank(std::move(candidates), &hybridStats);
    trace.dropped_malformed += hybridStats.dropped_malformed;
    trace.dropped_below_threshold = hybridStats.dropped_below_threshold;

    spdlog::debug("{}: {} ranked", stageToString(RetrievalStage::Rerank), ranked.size());
    size_t rerankDropped = 0;
    auto reranked = reranker_.rerank(normalized, std::move(ranked), &rerankDropped);
    trace.dropped_malformed += rerankDropped;

    spdlog::debug("{}: {} reranked", stageToString(RetrievalStage::Dedup), reranked.size());
    DiversityStats diversityStats;
    result.candidates = diversity_.filter(reranked, &diversityStats);
    trace.rejected_duplicate = diversityStats.duplicate;
    trace.rejected_adjacent = diversityStats.adjacent;
    trace.rejected_similar = diversityStats.similar;
    trace.rank_time = elapsedSince(stageStart);

    spdlog::debug("{}: {} passages ({} malformed, {} below threshold)",
                  stageToString(RetrievalStage::Return), result.size(), trace.dropped_malformed,
                  trace.dropped_below_threshold);

    if (useCache) {
        components_.queryCache->put(cacheKey, result, normalized);
    }
    return result;
}

Result<std::vector<ExpandedPassage>>
RetrievalOrchestrator::expandContext(const RetrievalResult& result, size_t window) const {
    if (!components_.documents) {
        return Error{ErrorCode::NotInitialized, "no document store configured"};
    }
    std::vector<ExpandedPassage> passages;
    passages.reserve(result.size());
    for (const auto& hit : result.candidates) {
        const size_t first = hit.chunk_index > window ? hit.chunk_index - window : 0;
        auto chunks = components_.documents->getChunksInRange(hit.document_id, first,
                                                              hit.chunk_index + window);
        if (!chunks) {
            return chunks.error();
        }
        passages.push_back(ExpandedPassage{hit, std::move(chunks).value()});
    }
    return passages;
}

} // namespace ragcore::search
