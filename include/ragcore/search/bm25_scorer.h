#pragma once

#include <ragcore/core/types.h>

#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ragcore::search {

struct Bm25Config {
    double k1 = 1.5; // Term frequency saturation
    double b = 0.75; // Length normalization

    Result<void> validate() const;
};

/**
 * @brief BM25 keyword relevance over corpus statistics of the indexed chunks.
 *
 * Keeps document frequencies and the average chunk length for every chunk added through
 * addChunk(). Scores are non-negative: IDF uses ln(1 + (N - df + 0.5) / (df + 0.5)), and a
 * chunk containing none of the query terms scores exactly 0.0. That is the normal outcome
 * for conceptual or cross-lingual queries.
 *
 * Thread-safe: scoring takes a shared lock, corpus updates an exclusive one.
 */
class Bm25Scorer {
public:
    explicit Bm25Scorer(Bm25Config config = {});

    /**
     * @brief Add a chunk to the corpus statistics, replacing any chunk with the same id.
     */
    void addChunk(const std::string& chunkId, std::string_view text);

    /**
     * @brief Remove a chunk from the corpus statistics.
     * @return false if the chunk was not indexed
     */
    bool removeChunk(const std::string& chunkId);

    /**
     * @brief Remove every chunk of a document (ids "<documentId>:<index>").
     * @return number of chunks removed
     */
    size_t removeDocument(DocumentId documentId);

    void clear();

    /**
     * @brief Score chunk text against a query using the current corpus statistics.
     */
    double score(std::string_view query, std::string_view chunkText) const;

    /**
     * @brief Score several chunk texts against one query under a single snapshot.
     */
    std::vector<double> scoreAll(std::string_view query,
                                 const std::vector<std::string_view>& chunkTexts) const;

    double idf(const std::string& term) const;
    size_t documentFrequency(const std::string& term) const;
    size_t chunkCount() const;
    double averageChunkLength() const;

    const Bm25Config& config() const { return config_; }

private:
    struct IndexedChunk {
        size_t length = 0;
        std::vector<std::string> terms; // unique
    };

    double idfLocked(const std::string& term) const;
    double scoreLocked(const std::vector<std::string>& queryTerms,
                       std::string_view chunkText) const;
    void eraseLocked(std::map<std::string, IndexedChunk>::iterator it);

    Bm25Config config_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, IndexedChunk> chunks_;
    std::unordered_map<std::string, size_t> documentFrequencies_;
    size_t totalLength_ = 0;
};

} // namespace ragcore::search
