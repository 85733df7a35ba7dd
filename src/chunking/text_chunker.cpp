#include <ragcore/chunking/text_chunker.h>
#include <ragcore/core/document.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace ragcore::chunking {

namespace {

bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string_view trimView(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::string_view ltrimView(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    return s.substr(b);
}

bool isTableRow(std::string_view line) {
    auto t = trimView(line);
    if (t.empty()) {
        return false;
    }
    return t.front() == '|' || std::count(t.begin(), t.end(), '|') >= 2;
}

bool isTableCaption(std::string_view line) {
    return trimView(line).rfind("[Table", 0) == 0;
}

// Markdown header separator such as |---|:---:|
bool isSeparatorRow(std::string_view line) {
    auto t = trimView(line);
    if (t.find('-') == std::string_view::npos) {
        return false;
    }
    return std::all_of(t.begin(), t.end(),
                       [](char c) { return c == '|' || c == '-' || c == ':' || c == ' '; });
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// The lines are views into one buffer, so a contiguous range maps back to a single view
std::string_view spanOf(const std::vector<std::string_view>& lines, size_t first, size_t last) {
    const char* begin = lines[first].data();
    const char* end = lines[last - 1].data() + lines[last - 1].size();
    return std::string_view(begin, static_cast<size_t>(end - begin));
}

// Length of the table starting at line i (caption included), or 0 if none starts there
size_t tableLengthAt(const std::vector<std::string_view>& lines, size_t i) {
    size_t rowStart = i;
    if (isTableCaption(lines[i]) && i + 1 < lines.size() && isTableRow(lines[i + 1])) {
        rowStart = i + 1;
    }
    size_t j = rowStart;
    while (j < lines.size() && isTableRow(lines[j])) {
        ++j;
    }
    return (j - rowStart >= 2) ? j - i : 0;
}

void hardSplit(std::string_view text, size_t budget, std::vector<std::string>& out) {
    size_t start = 0;
    while (start < text.size()) {
        size_t end = std::min(start + budget, text.size());
        if (end < text.size()) {
            size_t snapped = end;
            while (snapped > start && isContinuation(text[snapped])) {
                --snapped;
            }
            if (snapped > start) {
                end = snapped;
            }
        }
        out.emplace_back(text.substr(start, end - start));
        start = end;
    }
}

} // namespace

Result<void> ChunkingConfig::validate() const {
    if (chunk_size == 0) {
        return Error{ErrorCode::ValidationError, "chunk_size must be positive"};
    }
    if (chunk_overlap * 2 >= chunk_size) {
        return Error{ErrorCode::ValidationError,
                     "chunk_overlap must be less than half of chunk_size"};
    }
    if (separators.empty()) {
        return Error{ErrorCode::ValidationError, "at least one separator is required"};
    }
    return {};
}

TextChunker::TextChunker(ChunkingConfig config) : config_(std::move(config)) {
    if (config_.chunk_size == 0) {
        config_.chunk_size = ChunkingConfig{}.chunk_size;
    }
    if (config_.chunk_overlap * 2 >= config_.chunk_size) {
        spdlog::warn("Chunk overlap {} too large for chunk size {}; using {}",
                     config_.chunk_overlap, config_.chunk_size, config_.chunk_size / 10);
        config_.chunk_overlap = config_.chunk_size / 10;
    }
    if (config_.separators.empty()) {
        config_.separators = ChunkingConfig{}.separators;
    }
}

std::vector<TextChunk> TextChunker::chunk(std::string_view text) const {
    auto trimmed = trimView(text);
    if (trimmed.empty()) {
        return {};
    }

    std::vector<TextChunk> chunks;

    if (trimmed.size() <= config_.chunk_size) {
        TextChunk single;
        single.content = std::string(trimmed);
        single.char_length = utf8Length(single.content);
        if (config_.preserve_tables) {
            auto lines = splitLines(trimmed);
            for (size_t i = 0; i < lines.size() && !single.contains_table; ++i) {
                single.contains_table = tableLengthAt(lines, i) > 0;
            }
        }
        chunks.push_back(std::move(single));
        return chunks;
    }

    auto pieces = splitBlocks(trimmed);
    if (pieces.size() > 1) {
        pieces.erase(std::remove_if(pieces.begin(), pieces.end(),
                                    [this](const Piece& p) {
                                        return !p.is_table &&
                                               utf8Length(trimView(p.text)) <
                                                   config_.min_chunk_chars;
                                    }),
                     pieces.end());
    }

    chunks.reserve(pieces.size());
    for (auto& piece : pieces) {
        TextChunk c;
        c.chunk_index = chunks.size();
        c.contains_table = piece.is_table;

        // Overlap only between prose neighbours; tables carry their header instead
        if (config_.chunk_overlap > 0 && !chunks.empty() && !piece.is_table &&
            !chunks.back().contains_table) {
            const std::string& prev = chunks.back().content;
            size_t start = prev.size() - std::min(config_.chunk_overlap, prev.size());
            while (start < prev.size() && isContinuation(prev[start])) {
                ++start;
            }
            c.content = prev.substr(start);
            c.overlap_length = c.content.size();
        }

        c.content += piece.text;
        c.char_length = utf8Length(c.content);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

std::vector<TextChunker::Piece> TextChunker::splitBlocks(std::string_view text) const {
    std::vector<Piece> out;
    auto lines = splitLines(text);

    size_t proseBegin = 0;
    size_t i = 0;
    while (i < lines.size()) {
        size_t tableLen = config_.preserve_tables ? tableLengthAt(lines, i) : 0;
        if (tableLen == 0) {
            ++i;
            continue;
        }
        if (i > proseBegin) {
            splitProse(spanOf(lines, proseBegin, i), out);
        }
        std::vector<std::string_view> tableLines(lines.begin() + static_cast<ptrdiff_t>(i),
                                                 lines.begin() +
                                                     static_cast<ptrdiff_t>(i + tableLen));
        splitTable(tableLines, out);
        i += tableLen;
        proseBegin = i;
    }
    if (proseBegin < lines.size()) {
        splitProse(spanOf(lines, proseBegin, lines.size()), out);
    }
    return out;
}

void TextChunker::splitProse(std::string_view text, std::vector<Piece>& out) const {
    auto trimmed = trimView(text);
    if (trimmed.empty()) {
        return;
    }

    std::vector<std::string> parts;
    recursiveSplit(trimmed, 0, config_.chunk_size - config_.chunk_overlap, parts);
    for (const auto& part : parts) {
        auto body = ltrimView(part);
        if (!trimView(body).empty()) {
            out.push_back(Piece{std::string(body), false});
        }
    }
}

void TextChunker::splitTable(const std::vector<std::string_view>& lines,
                             std::vector<Piece>& out) const {
    auto whole = spanOf(lines, 0, lines.size());
    if (whole.size() <= config_.chunk_size) {
        out.push_back(Piece{std::string(whole), true});
        return;
    }

    // Caption, first row and markdown separator form the header repeated in every piece
    size_t idx = 0;
    std::string header;
    if (isTableCaption(lines[idx])) {
        header = std::string(lines[idx++]);
        header += '\n';
    }
    header += std::string(lines[idx++]);
    if (idx < lines.size() && isSeparatorRow(lines[idx])) {
        header += '\n';
        header += std::string(lines[idx++]);
    }

    std::string current = header;
    bool hasRows = false;
    for (; idx < lines.size(); ++idx) {
        const auto& row = lines[idx];
        if (hasRows && current.size() + 1 + row.size() > config_.chunk_size) {
            out.push_back(Piece{current, true});
            current = header;
            hasRows = false;
        }
        current += '\n';
        current += std::string(row);
        hasRows = true;
    }
    if (hasRows || out.empty()) {
        out.push_back(Piece{current, true});
    }
}

void TextChunker::recursiveSplit(std::string_view text, size_t separatorIndex, size_t budget,
                                 std::vector<std::string>& out) const {
    if (text.size() <= budget) {
        out.emplace_back(text);
        return;
    }

    const auto& separators = config_.separators;
    size_t idx = separatorIndex;
    while (idx < separators.size() && !separators[idx].empty() &&
           text.find(separators[idx]) == std::string_view::npos) {
        ++idx;
    }
    if (idx >= separators.size() || separators[idx].empty()) {
        hardSplit(text, budget, out);
        return;
    }

    // Split keeping each separator at the end of the segment it terminates
    const std::string& separator = separators[idx];
    std::vector<std::string_view> segments;
    size_t start = 0;
    size_t pos = 0;
    while ((pos = text.find(separator, start)) != std::string_view::npos) {
        segments.push_back(text.substr(start, pos + separator.size() - start));
        start = pos + separator.size();
    }
    if (start < text.size()) {
        segments.push_back(text.substr(start));
    }

    std::string current;
    for (const auto& segment : segments) {
        if (segment.size() > budget) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
            recursiveSplit(segment, idx + 1, budget, out);
            continue;
        }
        if (current.size() + segment.size() > budget) {
            out.push_back(std::move(current));
            current.clear();
        }
        current += segment;
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
}

} // namespace ragcore::chunking
