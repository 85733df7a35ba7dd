#pragma once

#include <ragcore/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace ragcore::chunking {

/**
 * Configuration for document chunking. Sizes are measured in bytes of UTF-8 text; cut
 * points are always moved to code point boundaries.
 */
struct ChunkingConfig {
    size_t chunk_size = 768;    // Maximum chunk length, overlap prefix included
    size_t chunk_overlap = 128; // Tail of the previous chunk repeated at the start of the next
    size_t min_chunk_chars = 10; // Smaller prose pieces are dropped from multi-chunk output
    bool preserve_tables = true;

    // Highest priority first; "" is the character-level last resort
    std::vector<std::string> separators = {"\n\n", "\n", ". ", "! ", "? ",
                                           "; ",   ", ", " ",  ""};

    Result<void> validate() const;
};

/**
 * A chunk of document text produced by TextChunker.
 */
struct TextChunk {
    size_t chunk_index = 0;
    std::string content;
    size_t char_length = 0;    // Code points in content
    size_t overlap_length = 0; // Bytes of content copied from the previous chunk
    bool contains_table = false;
};

/**
 * @brief Splits document text into overlapping, boundary-aware, table-preserving chunks.
 *
 * Prose is split recursively on the highest-priority separator that occurs in the text,
 * and the pieces are packed up to chunk_size - chunk_overlap so that the overlap prefix never
 * pushes a chunk over chunk_size. Tables (runs of '|' rows with an optional "[Table ...]"
 * caption) are emitted as their own chunks and are only ever cut at row boundaries, with
 * the caption and header row repeated in each piece.
 *
 * Stateless after construction; safe to share between threads.
 */
class TextChunker {
public:
    explicit TextChunker(ChunkingConfig config = {});

    std::vector<TextChunk> chunk(std::string_view text) const;

    const ChunkingConfig& config() const { return config_; }

private:
    struct Piece {
        std::string text;
        bool is_table = false;
    };

    std::vector<Piece> splitBlocks(std::string_view text) const;
    void splitProse(std::string_view text, std::vector<Piece>& out) const;
    void splitTable(const std::vector<std::string_view>& lines, std::vector<Piece>& out) const;

    void recursiveSplit(std::string_view text, size_t separatorIndex, size_t budget,
                        std::vector<std::string>& out) const;

    ChunkingConfig config_;
};

} // namespace ragcore::chunking
