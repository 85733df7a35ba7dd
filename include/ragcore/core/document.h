#pragma once

#include <ragcore/core/types.h>

#include <map>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace ragcore {

/**
 * @brief A source document as handed to the ingestion pipeline.
 *
 * The filename is the duplicate-ingestion key. Once chunked a document is immutable; it is
 * only removed by an explicit delete, which cascades to its chunks and vectors.
 */
struct Document {
    DocumentId id = 0;
    std::string filename;
    std::string raw_text;
    std::map<std::string, std::string> metadata;
    TimePoint created_at{};
};

/**
 * @brief A bounded slice of a document's text; the unit of retrieval.
 */
struct Chunk {
    DocumentId document_id = 0;
    std::string filename;
    size_t chunk_index = 0;
    std::string text;
    Embedding embedding;
    size_t char_length = 0;
    bool contains_table = false;

    [[nodiscard]] std::string id() const;
};

/**
 * @brief Lightweight description returned by duplicate checks.
 */
struct DocumentInfo {
    DocumentId id = 0;
    std::string filename;
    size_t chunk_count = 0;
    TimePoint created_at{};
};

/**
 * @brief Build the stable chunk identifier "<document_id>:<chunk_index>".
 */
std::string makeChunkId(DocumentId documentId, size_t chunkIndex);

/**
 * @brief Split a chunk identifier back into its parts.
 * @return std::nullopt when the identifier is not of the form "<int>:<int>"
 */
std::optional<std::pair<DocumentId, size_t>> parseChunkId(const std::string& chunkId);

/**
 * @brief Number of Unicode code points in a UTF-8 string.
 *
 * Continuation bytes are not counted; invalid sequences count one per lead byte.
 */
size_t utf8Length(std::string_view text) noexcept;

} // namespace ragcore
