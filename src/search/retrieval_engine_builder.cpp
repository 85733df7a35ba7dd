#include <ragcore/cache/memory_cache_backend.h>
#include <ragcore/cache/sqlite_cache_backend.h>
#include <ragcore/search/retrieval_engine_builder.h>

#include <spdlog/spdlog.h>

namespace ragcore::search {

RetrievalEngineBuilder::RetrievalEngineBuilder(config::EngineConfig config)
    : config_(std::move(config)) {}

Result<RetrievalEngine> RetrievalEngineBuilder::build() {
    if (!embedder_) {
        return Error{ErrorCode::InvalidArgument, "an embedder is required"};
    }
    if (auto r = config_.validate(); !r) {
        return r.error();
    }

    RetrievalEngine engine;
    engine.config = config_;

    auto l2 = l2_;
    if (!l2 && config_.cache.l2.enabled) {
        l2 = std::make_shared<cache::MemoryCacheBackend>(config_.cache.l2.capacity);
    }
    auto l3 = l3_;
    if (!l3 && config_.cache.l3.enabled) {
        l3 = std::make_shared<cache::SqliteCacheBackend>(config_.cache.l3_path,
                                                         config_.cache.l3.capacity);
    }

    engine.cache = std::make_shared<cache::CacheManager>(config_.cache, l2, l3, clock_);
    if (auto r = engine.cache->open(); !r) {
        return r.error();
    }
    engine.embeddingCache = std::make_shared<cache::EmbeddingCache>(engine.cache);
    engine.queryCache = std::make_shared<cache::QueryResultCache>(engine.cache);

    engine.documents = documents_ ? documents_ : std::make_shared<storage::InMemoryDocumentStore>();
    engine.vectors = vectors_ ? vectors_ : std::make_shared<vector::InMemoryVectorStore>();
    engine.bm25 = std::make_shared<Bm25Scorer>(config_.bm25);

    auto batcher = std::make_shared<vector::EmbeddingBatcher>(
        embedder_, engine.embeddingCache,
        vector::EmbeddingBatcherConfig{config_.ingest.embed_batch_size,
                                       config_.ingest.embed_workers});
    engine.ingestion = std::make_shared<ingest::IngestionPipeline>(
        config_.chunking, engine.documents, engine.vectors, engine.bm25, std::move(batcher),
        engine.queryCache);

    RetrievalComponents components{embedder_,   engine.vectors,        engine.documents,
                                   engine.bm25, engine.embeddingCache, engine.queryCache};
    engine.orchestrator = std::make_shared<RetrievalOrchestrator>(
        config_.retrieval, config_.hybrid, config_.rerank, config_.diversity,
        std::move(components));

    spdlog::info("Retrieval engine ready (model {}, dim {}, L2 {}, L3 {})",
                 embedder_->modelName(), embedder_->dimension(),
                 l2 ? l2->name() : std::string("off"), l3 ? l3->name() : std::string("off"));
    return engine;
}

} // namespace ragcore::search
