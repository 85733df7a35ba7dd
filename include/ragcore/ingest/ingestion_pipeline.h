#pragma once

#include <ragcore/cache/query_result_cache.h>
#include <ragcore/chunking/text_chunker.h>
#include <ragcore/core/document.h>
#include <ragcore/core/types.h>
#include <ragcore/search/bm25_scorer.h>
#include <ragcore/storage/document_store.h>
#include <ragcore/vector/embedding_batcher.h>
#include <ragcore/vector/vector_store.h>

#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ragcore::ingest {

struct IngestConfig {
    size_t embed_batch_size = 64;
    size_t embed_workers = 8;

    Result<void> validate() const;
};

/**
 * @brief Outcome of ingesting one document.
 */
struct IngestReport {
    DocumentId document_id = 0;
    size_t chunks_created = 0;
    size_t chunks_failed = 0;
    size_t embeddings_cached = 0;
    bool already_existed = false;
    std::string message;
};

using ProgressCallback = std::function<void(const std::string&)>;

/**
 * @brief Turns documents into retrievable chunks and deletes them again.
 *
 * Per document: duplicate check by filename, chunking, embedding (cache first), then writes
 * in a fixed order: document store, vector store, BM25. A chunk becomes retrievable when its
 * vector is upserted, which happens only after its embedding is cached and its text stored.
 * Every change to the corpus invalidates cached query results.
 */
class IngestionPipeline {
public:
    IngestionPipeline(chunking::ChunkingConfig chunking, std::shared_ptr<storage::IDocumentStore> documents,
                      std::shared_ptr<vector::IVectorStore> vectors,
                      std::shared_ptr<search::Bm25Scorer> bm25,
                      std::shared_ptr<vector::EmbeddingBatcher> batcher,
                      std::shared_ptr<cache::QueryResultCache> queryCache = nullptr);

    Result<IngestReport> ingest(const Document& document, const ProgressCallback& progress = {});

    std::vector<Result<IngestReport>> ingestMany(const std::vector<Document>& documents,
                                                 const ProgressCallback& progress = {});

    /**
     * @brief Delete a document with its chunks, vectors and BM25 statistics.
     */
    Result<void> remove(DocumentId documentId);

    const chunking::TextChunker& chunker() const { return chunker_; }

private:
    Result<IngestReport> ingestClaimed(const Document& document, const ProgressCallback& progress);
    void rollback(DocumentId documentId);
    void invalidateQueries();

    chunking::TextChunker chunker_;
    std::shared_ptr<storage::IDocumentStore> documents_;
    std::shared_ptr<vector::IVectorStore> vectors_;
    std::shared_ptr<search::Bm25Scorer> bm25_;
    std::shared_ptr<vector::EmbeddingBatcher> batcher_;
    std::shared_ptr<cache::QueryResultCache> queryCache_;

    std::mutex inFlightMutex_;
    std::set<std::string> inFlight_; ///< filenames currently being ingested
};

} // namespace ragcore::ingest
