#pragma once

#include <ragcore/cache/cache_backend.h>
#include <ragcore/cache/cache_manager.h>
#include <ragcore/cache/embedding_cache.h>
#include <ragcore/cache/query_result_cache.h>
#include <ragcore/config/engine_config.h>
#include <ragcore/core/types.h>
#include <ragcore/ingest/ingestion_pipeline.h>
#include <ragcore/search/bm25_scorer.h>
#include <ragcore/search/retrieval_orchestrator.h>
#include <ragcore/storage/document_store.h>
#include <ragcore/vector/embedder.h>
#include <ragcore/vector/embedding_batcher.h>
#include <ragcore/vector/vector_store.h>

#include <memory>

namespace ragcore::search {

/**
 * @brief Everything a running engine holds, sharing one cache manager and one BM25 index.
 */
struct RetrievalEngine {
    config::EngineConfig config;
    std::shared_ptr<cache::CacheManager> cache;
    std::shared_ptr<cache::EmbeddingCache> embeddingCache;
    std::shared_ptr<cache::QueryResultCache> queryCache;
    std::shared_ptr<storage::IDocumentStore> documents;
    std::shared_ptr<vector::IVectorStore> vectors;
    std::shared_ptr<Bm25Scorer> bm25;
    std::shared_ptr<ingest::IngestionPipeline> ingestion;
    std::shared_ptr<RetrievalOrchestrator> orchestrator;
};

/**
 * RetrievalEngineBuilder
 *
 * Composes a RetrievalEngine from one validated EngineConfig. Only the embedder is
 * required; other collaborators default to the in-process implementations (in-memory
 * document and vector stores, MemoryCacheBackend for L2, SqliteCacheBackend at
 * cache.l3_path for L3, in memory when the path is empty).
 */
class RetrievalEngineBuilder {
public:
    explicit RetrievalEngineBuilder(config::EngineConfig config = {});

    RetrievalEngineBuilder& withEmbedder(std::shared_ptr<vector::IEmbedder> embedder) {
        embedder_ = std::move(embedder);
        return *this;
    }

    RetrievalEngineBuilder& withVectorStore(std::shared_ptr<vector::IVectorStore> store) {
        vectors_ = std::move(store);
        return *this;
    }

    RetrievalEngineBuilder& withDocumentStore(std::shared_ptr<storage::IDocumentStore> store) {
        documents_ = std::move(store);
        return *this;
    }

    RetrievalEngineBuilder& withL2Backend(std::shared_ptr<cache::ICacheBackend> backend) {
        l2_ = std::move(backend);
        return *this;
    }

    RetrievalEngineBuilder& withL3Backend(std::shared_ptr<cache::IAnalyticsCacheBackend> backend) {
        l3_ = std::move(backend);
        return *this;
    }

    RetrievalEngineBuilder& withSteadyClock(cache::SteadyClockFn clock) {
        clock_ = std::move(clock);
        return *this;
    }

    /**
     * @brief Validate the config, open the cache manager and wire the components.
     */
    Result<RetrievalEngine> build();

private:
    config::EngineConfig config_;
    std::shared_ptr<vector::IEmbedder> embedder_;
    std::shared_ptr<vector::IVectorStore> vectors_;
    std::shared_ptr<storage::IDocumentStore> documents_;
    std::shared_ptr<cache::ICacheBackend> l2_;
    std::shared_ptr<cache::IAnalyticsCacheBackend> l3_;
    cache::SteadyClockFn clock_ = cache::steadyNow();
};

} // namespace ragcore::search
