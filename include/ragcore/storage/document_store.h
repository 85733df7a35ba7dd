#pragma once

#include <ragcore/core/document.h>
#include <ragcore/core/types.h>

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ragcore::storage {

/**
 * @brief Source of truth for documents and their chunk texts.
 */
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    /**
     * @brief Look a document up by filename, the duplicate-ingestion key.
     */
    virtual Result<std::optional<DocumentInfo>> exists(const std::string& filename) = 0;

    /**
     * @brief Store a document and assign its id.
     * @return AlreadyExists when the filename is taken
     */
    virtual Result<DocumentId> insertDocument(const Document& document) = 0;

    virtual Result<void> insertChunks(DocumentId documentId, const std::vector<Chunk>& chunks) = 0;

    virtual Result<std::optional<Chunk>> getChunk(const std::string& chunkId) = 0;
    virtual Result<std::optional<std::string>> getChunkText(const std::string& chunkId) = 0;

    /**
     * @brief Chunks of one document with first <= chunk_index <= last, in index order.
     */
    virtual Result<std::vector<Chunk>> getChunksInRange(DocumentId documentId, size_t first,
                                                        size_t last) = 0;

    virtual Result<std::optional<DocumentInfo>> getDocument(DocumentId documentId) = 0;
    virtual Result<std::vector<DocumentInfo>> listDocuments() = 0;

    /**
     * @brief Delete a document and its chunks.
     * @return NotFound for an unknown id
     */
    virtual Result<void> removeDocument(DocumentId documentId) = 0;
};

class InMemoryDocumentStore : public IDocumentStore {
public:
    Result<std::optional<DocumentInfo>> exists(const std::string& filename) override;
    Result<DocumentId> insertDocument(const Document& document) override;
    Result<void> insertChunks(DocumentId documentId, const std::vector<Chunk>& chunks) override;
    Result<std::optional<Chunk>> getChunk(const std::string& chunkId) override;
    Result<std::optional<std::string>> getChunkText(const std::string& chunkId) override;
    Result<std::vector<Chunk>> getChunksInRange(DocumentId documentId, size_t first,
                                                size_t last) override;
    Result<std::optional<DocumentInfo>> getDocument(DocumentId documentId) override;
    Result<std::vector<DocumentInfo>> listDocuments() override;
    Result<void> removeDocument(DocumentId documentId) override;

private:
    struct StoredDocument {
        Document document;
        std::map<size_t, Chunk> chunks; ///< keyed by chunk_index
    };

    DocumentInfo infoLocked(const StoredDocument& stored) const;

    mutable std::shared_mutex mutex_;
    std::map<DocumentId, StoredDocument> documents_;
    std::map<std::string, DocumentId> byFilename_;
    DocumentId nextId_ = 1;
};

} // namespace ragcore::storage
