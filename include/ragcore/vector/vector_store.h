#pragma once

#include <ragcore/core/types.h>

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace ragcore::vector {

/**
 * @brief One indexed chunk vector.
 */
struct VectorRecord {
    std::string chunk_id;
    DocumentId document_id = 0;
    std::string filename;
    Embedding embedding;
};

struct VectorMatch {
    std::string chunk_id;
    double similarity = 0.0; ///< cosine, in [-1, 1]
};

/**
 * @brief Restricts a search to some documents and/or a file extension.
 *
 * Empty members do not restrict. The extension is compared case-insensitively, with or
 * without a leading dot.
 */
struct VectorFilter {
    std::set<DocumentId> document_ids;
    std::string extension;

    [[nodiscard]] bool empty() const { return document_ids.empty() && extension.empty(); }
    [[nodiscard]] bool matches(DocumentId documentId, const std::string& filename) const;

    /**
     * @brief Stable text form, used in cache keys.
     */
    [[nodiscard]] std::string signature() const;
};

/**
 * @brief Nearest-neighbour index over chunk embeddings.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    /**
     * @brief Highest cosine similarity first; ties by chunk id.
     */
    virtual Result<std::vector<VectorMatch>> search(const Embedding& query, size_t topK,
                                                    const VectorFilter* filter = nullptr) = 0;

    virtual Result<void> upsert(const VectorRecord& record) = 0;

    /**
     * @return number of vectors removed
     */
    virtual Result<size_t> removeDocument(DocumentId documentId) = 0;

    virtual Result<size_t> size() = 0;
};

/**
 * @brief Exact flat-scan store. All vectors must share one dimension, fixed by the first
 * upsert.
 */
class InMemoryVectorStore : public IVectorStore {
public:
    Result<std::vector<VectorMatch>> search(const Embedding& query, size_t topK,
                                            const VectorFilter* filter = nullptr) override;
    Result<void> upsert(const VectorRecord& record) override;
    Result<size_t> removeDocument(DocumentId documentId) override;
    Result<size_t> size() override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, VectorRecord> records_;
    size_t dimension_ = 0;
};

/**
 * @brief Cosine similarity; 0 when either vector has zero norm or the sizes differ.
 */
double cosineSimilarity(std::span<const float> a, std::span<const float> b);

} // namespace ragcore::vector
