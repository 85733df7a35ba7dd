#include <ragcore/core/document.h>

#include <charconv>

namespace ragcore {

std::string Chunk::id() const {
    return makeChunkId(document_id, chunk_index);
}

std::string makeChunkId(DocumentId documentId, size_t chunkIndex) {
    return std::to_string(documentId) + ":" + std::to_string(chunkIndex);
}

std::optional<std::pair<DocumentId, size_t>> parseChunkId(const std::string& chunkId) {
    auto colon = chunkId.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= chunkId.size()) {
        return std::nullopt;
    }

    DocumentId docId = 0;
    const char* begin = chunkId.data();
    auto [p1, ec1] = std::from_chars(begin, begin + colon, docId);
    if (ec1 != std::errc{} || p1 != begin + colon) {
        return std::nullopt;
    }

    size_t index = 0;
    const char* end = chunkId.data() + chunkId.size();
    auto [p2, ec2] = std::from_chars(begin + colon + 1, end, index);
    if (ec2 != std::errc{} || p2 != end) {
        return std::nullopt;
    }
    return std::make_pair(docId, index);
}

size_t utf8Length(std::string_view text) noexcept {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace ragcore
