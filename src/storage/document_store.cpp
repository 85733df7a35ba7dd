#include <ragcore/storage/document_store.h>

#include <mutex>

namespace ragcore::storage {

DocumentInfo InMemoryDocumentStore::infoLocked(const StoredDocument& stored) const {
    return DocumentInfo{stored.document.id, stored.document.filename, stored.chunks.size(),
                        stored.document.created_at};
}

Result<std::optional<DocumentInfo>> InMemoryDocumentStore::exists(const std::string& filename) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = byFilename_.find(filename);
    if (it == byFilename_.end()) {
        return std::optional<DocumentInfo>{};
    }
    return std::optional<DocumentInfo>{infoLocked(documents_.at(it->second))};
}

Result<DocumentId> InMemoryDocumentStore::insertDocument(const Document& document) {
    if (document.filename.empty()) {
        return Error{ErrorCode::InvalidArgument, "document filename must not be empty"};
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (byFilename_.contains(document.filename)) {
        return Error{ErrorCode::AlreadyExists, "document already stored: " + document.filename};
    }
    DocumentId id = nextId_++;
    StoredDocument stored;
    stored.document = document;
    stored.document.id = id;
    if (stored.document.created_at == TimePoint{}) {
        stored.document.created_at = std::chrono::system_clock::now();
    }
    documents_.emplace(id, std::move(stored));
    byFilename_.emplace(document.filename, id);
    return id;
}

Result<void> InMemoryDocumentStore::insertChunks(DocumentId documentId,
                                                 const std::vector<Chunk>& chunks) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = documents_.find(documentId);
    if (it == documents_.end()) {
        return Error{ErrorCode::NotFound, "no document with id " + std::to_string(documentId)};
    }
    for (const auto& chunk : chunks) {
        if (chunk.document_id != documentId) {
            return Error{ErrorCode::InvalidArgument,
                         "chunk " + chunk.id() + " belongs to another document"};
        }
    }
    for (const auto& chunk : chunks) {
        Chunk stored = chunk;
        stored.filename = it->second.document.filename;
        it->second.chunks[chunk.chunk_index] = std::move(stored);
    }
    return {};
}

Result<std::optional<Chunk>> InMemoryDocumentStore::getChunk(const std::string& chunkId) {
    auto parsed = parseChunkId(chunkId);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument, "malformed chunk id: " + chunkId};
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto doc = documents_.find(parsed->first);
    if (doc == documents_.end()) {
        return std::optional<Chunk>{};
    }
    auto chunk = doc->second.chunks.find(parsed->second);
    if (chunk == doc->second.chunks.end()) {
        return std::optional<Chunk>{};
    }
    return std::optional<Chunk>{chunk->second};
}

Result<std::optional<std::string>> InMemoryDocumentStore::getChunkText(const std::string& chunkId) {
    auto chunk = getChunk(chunkId);
    if (!chunk) {
        return chunk.error();
    }
    if (!chunk.value()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{chunk.value()->text};
}

Result<std::vector<Chunk>> InMemoryDocumentStore::getChunksInRange(DocumentId documentId,
                                                                   size_t first, size_t last) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Chunk> out;
    auto doc = documents_.find(documentId);
    if (doc == documents_.end() || first > last) {
        return out;
    }
    const auto& chunks = doc->second.chunks;
    for (auto it = chunks.lower_bound(first); it != chunks.end() && it->first <= last; ++it) {
        out.push_back(it->second);
    }
    return out;
}

Result<std::optional<DocumentInfo>> InMemoryDocumentStore::getDocument(DocumentId documentId) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = documents_.find(documentId);
    if (it == documents_.end()) {
        return std::optional<DocumentInfo>{};
    }
    return std::optional<DocumentInfo>{infoLocked(it->second)};
}

Result<std::vector<DocumentInfo>> InMemoryDocumentStore::listDocuments() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<DocumentInfo> out;
    out.reserve(documents_.size());
    for (const auto& [id, stored] : documents_) {
        out.push_back(infoLocked(stored));
    }
    return out;
}

Result<void> InMemoryDocumentStore::removeDocument(DocumentId documentId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = documents_.find(documentId);
    if (it == documents_.end()) {
        return Error{ErrorCode::NotFound, "no document with id " + std::to_string(documentId)};
    }
    byFilename_.erase(it->second.document.filename);
    documents_.erase(it);
    return {};
}

} // namespace ragcore::storage
