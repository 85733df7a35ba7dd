#include <ragcore/ingest/ingestion_pipeline.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace ragcore::ingest {

namespace {

std::string_view trimmedView(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

Result<size_t> removeVectors(vector::IVectorStore& vectors, DocumentId documentId) {
    try {
        auto removed = vectors.removeDocument(documentId);
        if (!removed) {
            return Error{ErrorCode::VectorStoreUnavailable, removed.error().message};
        }
        return removed;
    } catch (const std::exception& e) {
        return Error{ErrorCode::VectorStoreUnavailable, e.what()};
    }
}

} // namespace

Result<void> IngestConfig::validate() const {
    if (embed_batch_size == 0 || embed_batch_size > 4096) {
        return Error{ErrorCode::ValidationError, "embed_batch_size must be in 1..4096"};
    }
    if (embed_workers == 0 || embed_workers > 256) {
        return Error{ErrorCode::ValidationError, "embed_workers must be in 1..256"};
    }
    return {};
}

IngestionPipeline::IngestionPipeline(chunking::ChunkingConfig chunking,
                                     std::shared_ptr<storage::IDocumentStore> documents,
                                     std::shared_ptr<vector::IVectorStore> vectors,
                                     std::shared_ptr<search::Bm25Scorer> bm25,
                                     std::shared_ptr<vector::EmbeddingBatcher> batcher,
                                     std::shared_ptr<cache::QueryResultCache> queryCache)
    : chunker_(std::move(chunking)), documents_(std::move(documents)),
      vectors_(std::move(vectors)), bm25_(std::move(bm25)), batcher_(std::move(batcher)),
      queryCache_(std::move(queryCache)) {}

Result<IngestReport> IngestionPipeline::ingest(const Document& document,
                                               const ProgressCallback& progress) {
    if (document.filename.empty()) {
        return Error{ErrorCode::InvalidArgument, "document filename must not be empty"};
    }
    if (!documents_ || !vectors_ || !bm25_ || !batcher_) {
        return Error{ErrorCode::NotInitialized, "ingestion pipeline is missing a collaborator"};
    }

    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        if (!inFlight_.insert(document.filename).second) {
            return Error{ErrorCode::AlreadyExists,
                         "document is already being ingested: " + document.filename};
        }
    }
    struct InFlightRelease {
        IngestionPipeline& self;
        const std::string& filename;
        ~InFlightRelease() {
            std::lock_guard<std::mutex> lock(self.inFlightMutex_);
            self.inFlight_.erase(filename);
        }
    } release{*this, document.filename};

    auto existing = documents_->exists(document.filename);
    if (!existing) {
        return existing.error();
    }
    if (const auto& info = existing.value()) {
        IngestReport report;
        report.document_id = info->id;
        report.already_existed = true;
        report.message = fmt::format("Document '{}' already exists (ID: {}, {} chunks). "
                                     "Skipping ingestion.",
                                     info->filename, info->id, info->chunk_count);
        spdlog::info("{}", report.message);
        if (progress) {
            progress(report.message);
        }
        return report;
    }

    return ingestClaimed(document, progress);
}

Result<IngestReport> IngestionPipeline::ingestClaimed(const Document& document,
                                                      const ProgressCallback& progress) {
    const auto& filename = document.filename;
    const size_t minChars = chunker_.config().min_chunk_chars;
    auto content = trimmedView(document.raw_text);
    if (utf8Length(content) < minChars) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Document {} has insufficient content ({} characters)", filename,
                                 utf8Length(content))};
    }

    if (progress) {
        progress(fmt::format("Chunking {}...", filename));
    }
    auto pieces = chunker_.chunk(document.raw_text);
    if (pieces.empty()) {
        return Error{ErrorCode::InvalidArgument, "No chunks generated from " + filename};
    }
    spdlog::debug("Chunked {} into {} chunks", filename, pieces.size());

    if (progress) {
        progress(fmt::format("Generating embeddings for {} chunks...", pieces.size()));
    }
    std::vector<std::string> texts;
    texts.reserve(pieces.size());
    for (const auto& piece : pieces) {
        texts.push_back(piece.content);
    }
    vector::BatchEmbeddingStats embedStats;
    auto embedded = batcher_->embedAll(texts, &embedStats);

    IngestReport report;
    std::vector<Chunk> chunks;
    chunks.reserve(pieces.size());
    for (size_t i = 0; i < pieces.size(); ++i) {
        auto& outcome = embedded[i];
        if (!outcome.embedding) {
            spdlog::warn("Failed to embed chunk {} of {}: {}", pieces[i].chunk_index, filename,
                         outcome.embedding.error().message);
            ++report.chunks_failed;
            continue;
        }
        Chunk chunk;
        chunk.filename = filename;
        chunk.chunk_index = pieces[i].chunk_index;
        chunk.text = pieces[i].content;
        chunk.char_length = pieces[i].char_length;
        chunk.contains_table = pieces[i].contains_table;
        chunk.embedding = std::move(outcome.embedding).value();
        chunks.push_back(std::move(chunk));
    }
    report.embeddings_cached = embedStats.cache_hits;

    if (chunks.empty()) {
        return Error{ErrorCode::EmbeddingUnavailable,
                     "No chunks were successfully embedded for " + filename};
    }

    Document stored = document;
    if (stored.created_at == TimePoint{}) {
        stored.created_at = std::chrono::system_clock::now();
    }
    stored.metadata["total_chunks"] = std::to_string(pieces.size());
    auto inserted = documents_->insertDocument(stored);
    if (!inserted) {
        return inserted.error();
    }
    const DocumentId id = inserted.value();
    for (auto& chunk : chunks) {
        chunk.document_id = id;
    }

    if (auto r = documents_->insertChunks(id, chunks); !r) {
        rollback(id);
        return r.error();
    }
    for (const auto& chunk : chunks) {
        std::string cause;
        try {
            auto r = vectors_->upsert(vector::VectorRecord{chunk.id(), id, filename,
                                                           chunk.embedding});
            if (!r) {
                cause = r.error().message;
            }
        } catch (const std::exception& e) {
            cause = e.what();
        }
        if (!cause.empty()) {
            rollback(id);
            return Error{ErrorCode::VectorStoreUnavailable,
                         "vector upsert failed for " + chunk.id() + ": " + cause};
        }
    }

    for (const auto& chunk : chunks) {
        bm25_->addChunk(chunk.id(), chunk.text);
    }

    invalidateQueries();

    report.document_id = id;
    report.chunks_created = chunks.size();
    report.message = fmt::format("Successfully ingested {} ({} chunks)", filename, chunks.size());
    spdlog::info("Ingested {} as document {} ({} chunks, {} failed, {} embeddings cached)",
                 filename, id, report.chunks_created, report.chunks_failed,
                 report.embeddings_cached);
    if (progress) {
        progress(report.message);
    }
    return report;
}

std::vector<Result<IngestReport>> IngestionPipeline::ingestMany(
    const std::vector<Document>& documents, const ProgressCallback& progress) {
    std::vector<Result<IngestReport>> results;
    results.reserve(documents.size());
    spdlog::info("Starting ingestion of {} documents", documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        if (progress) {
            progress(fmt::format("Processing document {}/{}", i + 1, documents.size()));
        }
        results.push_back(ingest(documents[i], progress));
    }
    return results;
}

void IngestionPipeline::rollback(DocumentId documentId) {
    bm25_->removeDocument(documentId);
    if (auto r = removeVectors(*vectors_, documentId); !r) {
        spdlog::error("Rollback of vectors for document {} failed: {}", documentId,
                      r.error().message);
    }
    if (auto r = documents_->removeDocument(documentId); !r) {
        spdlog::error("Rollback of document {} failed: {}", documentId, r.error().message);
    }
}

Result<void> IngestionPipeline::remove(DocumentId documentId) {
    if (!documents_ || !vectors_ || !bm25_) {
        return Error{ErrorCode::NotInitialized, "ingestion pipeline is missing a collaborator"};
    }
    auto info = documents_->getDocument(documentId);
    if (!info) {
        return info.error();
    }
    if (!info.value()) {
        return Error{ErrorCode::NotFound, "no document with id " + std::to_string(documentId)};
    }

    auto vectorsRemoved = removeVectors(*vectors_, documentId);
    if (!vectorsRemoved) {
        return vectorsRemoved.error();
    }
    const size_t chunksRemoved = bm25_->removeDocument(documentId);
    if (auto r = documents_->removeDocument(documentId); !r) {
        return r;
    }

    invalidateQueries();
    spdlog::info("Deleted document {} ({}): {} vectors, {} indexed chunks", documentId,
                 info.value()->filename, vectorsRemoved.value(), chunksRemoved);
    return {};
}

void IngestionPipeline::invalidateQueries() {
    if (!queryCache_) {
        return;
    }
    auto removed = queryCache_->invalidateAll();
    spdlog::debug("Corpus changed, dropped {} cached query results", removed);
}

} // namespace ragcore::ingest
