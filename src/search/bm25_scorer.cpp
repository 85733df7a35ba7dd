#include <ragcore/search/bm25_scorer.h>
#include <ragcore/search/tokenizer.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_set>

namespace ragcore::search {

namespace {
std::vector<std::string> uniqueTerms(std::string_view text) {
    auto tokens = tokenize(text);
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}
} // namespace

Result<void> Bm25Config::validate() const {
    if (!(k1 > 0.0) || !std::isfinite(k1)) {
        return Error{ErrorCode::ValidationError, "bm25 k1 must be positive"};
    }
    if (!(b >= 0.0 && b <= 1.0)) {
        return Error{ErrorCode::ValidationError, "bm25 b must be within [0, 1]"};
    }
    return {};
}

Bm25Scorer::Bm25Scorer(Bm25Config config) : config_(config) {}

void Bm25Scorer::addChunk(const std::string& chunkId, std::string_view text) {
    auto tokens = tokenize(text);
    IndexedChunk indexed;
    indexed.length = tokens.size();
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    indexed.terms = std::move(tokens);

    std::unique_lock lock(mutex_);
    if (auto it = chunks_.find(chunkId); it != chunks_.end()) {
        eraseLocked(it);
    }
    for (const auto& term : indexed.terms) {
        ++documentFrequencies_[term];
    }
    totalLength_ += indexed.length;
    chunks_.emplace(chunkId, std::move(indexed));
}

bool Bm25Scorer::removeChunk(const std::string& chunkId) {
    std::unique_lock lock(mutex_);
    auto it = chunks_.find(chunkId);
    if (it == chunks_.end()) {
        return false;
    }
    eraseLocked(it);
    return true;
}

size_t Bm25Scorer::removeDocument(DocumentId documentId) {
    const std::string prefix = std::to_string(documentId) + ":";
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    auto it = chunks_.lower_bound(prefix);
    while (it != chunks_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        auto next = std::next(it);
        eraseLocked(it);
        it = next;
        ++removed;
    }
    return removed;
}

void Bm25Scorer::eraseLocked(std::map<std::string, IndexedChunk>::iterator it) {
    for (const auto& term : it->second.terms) {
        auto df = documentFrequencies_.find(term);
        if (df != documentFrequencies_.end() && --df->second == 0) {
            documentFrequencies_.erase(df);
        }
    }
    totalLength_ -= it->second.length;
    chunks_.erase(it);
}

void Bm25Scorer::clear() {
    std::unique_lock lock(mutex_);
    chunks_.clear();
    documentFrequencies_.clear();
    totalLength_ = 0;
}

double Bm25Scorer::score(std::string_view query, std::string_view chunkText) const {
    auto terms = uniqueTerms(query);
    std::shared_lock lock(mutex_);
    return scoreLocked(terms, chunkText);
}

std::vector<double> Bm25Scorer::scoreAll(std::string_view query,
                                         const std::vector<std::string_view>& chunkTexts) const {
    auto terms = uniqueTerms(query);
    std::vector<double> scores;
    scores.reserve(chunkTexts.size());

    std::shared_lock lock(mutex_);
    for (const auto& text : chunkTexts) {
        scores.push_back(scoreLocked(terms, text));
    }
    return scores;
}

double Bm25Scorer::scoreLocked(const std::vector<std::string>& queryTerms,
                               std::string_view chunkText) const {
    if (queryTerms.empty()) {
        return 0.0;
    }

    auto docTerms = tokenize(chunkText);
    std::unordered_map<std::string, size_t> termFreq;
    for (const auto& term : docTerms) {
        ++termFreq[term];
    }

    const double docLength = static_cast<double>(docTerms.size());
    // An empty corpus leaves length normalization neutral
    const double avgdl =
        chunks_.empty() ? std::max(docLength, 1.0)
                        : std::max(static_cast<double>(totalLength_) / chunks_.size(), 1.0);

    double total = 0.0;
    for (const auto& term : queryTerms) {
        auto tf_it = termFreq.find(term);
        if (tf_it == termFreq.end()) {
            continue;
        }
        const double tf = static_cast<double>(tf_it->second);
        const double norm = tf + config_.k1 * (1.0 - config_.b + config_.b * docLength / avgdl);
        total += idfLocked(term) * (tf * (config_.k1 + 1.0)) / norm;
    }
    return total;
}

double Bm25Scorer::idfLocked(const std::string& term) const {
    const double n = static_cast<double>(chunks_.size());
    double df = 0.0;
    if (auto it = documentFrequencies_.find(term); it != documentFrequencies_.end()) {
        df = static_cast<double>(it->second);
    }
    return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

double Bm25Scorer::idf(const std::string& term) const {
    std::shared_lock lock(mutex_);
    return idfLocked(term);
}

size_t Bm25Scorer::documentFrequency(const std::string& term) const {
    std::shared_lock lock(mutex_);
    auto it = documentFrequencies_.find(term);
    return it == documentFrequencies_.end() ? 0 : it->second;
}

size_t Bm25Scorer::chunkCount() const {
    std::shared_lock lock(mutex_);
    return chunks_.size();
}

double Bm25Scorer::averageChunkLength() const {
    std::shared_lock lock(mutex_);
    return chunks_.empty() ? 0.0 : static_cast<double>(totalLength_) / chunks_.size();
}

} // namespace ragcore::search
