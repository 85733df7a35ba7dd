#include <ragcore/core/document.h>
#include <ragcore/search/reranker.h>
#include <ragcore/search/tokenizer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace ragcore::search {

Result<void> RerankerConfig::validate() const {
    if (top_n == 0 || top_n > 200) {
        return Error{ErrorCode::ValidationError, "rerank top_n must be within [1, 200]"};
    }
    for (double w : {combined_weight, keyword_weight, position_weight, length_weight}) {
        if (!(w >= 0.0) || !std::isfinite(w)) {
            return Error{ErrorCode::ValidationError, "rerank weights must be non-negative"};
        }
    }
    if (combined_weight + keyword_weight + position_weight + length_weight <= 0.0) {
        return Error{ErrorCode::ValidationError, "at least one rerank weight must be positive"};
    }
    if (position_decay < 0.0) {
        return Error{ErrorCode::ValidationError, "position_decay must be non-negative"};
    }
    if (ideal_min_chars == 0 || ideal_min_chars > ideal_max_chars) {
        return Error{ErrorCode::ValidationError,
                     "ideal passage length range must satisfy 0 < min <= max"};
    }
    return {};
}

Reranker::Reranker(RerankerConfig config) : config_(config) {
    double sum = config_.combined_weight + config_.keyword_weight + config_.position_weight +
                 config_.length_weight;
    if (sum > 0.0) {
        config_.combined_weight /= sum;
        config_.keyword_weight /= sum;
        config_.position_weight /= sum;
        config_.length_weight /= sum;
    }
    if (config_.ideal_min_chars == 0) {
        config_.ideal_min_chars = 1;
    }
    config_.ideal_max_chars = std::max(config_.ideal_max_chars, config_.ideal_min_chars);
}

double Reranker::keywordOverlap(const std::unordered_set<std::string>& queryTokens,
                                std::string_view text) {
    if (queryTokens.empty()) {
        return 0.0;
    }
    auto passageTokens = tokenSet(text);
    size_t matched = 0;
    for (const auto& token : queryTokens) {
        if (passageTokens.count(token)) {
            ++matched;
        }
    }
    return static_cast<double>(matched) / static_cast<double>(queryTokens.size());
}

double Reranker::positionScore(size_t chunkIndex) const {
    return 1.0 / (1.0 + config_.position_decay * static_cast<double>(chunkIndex));
}

double Reranker::lengthScore(size_t charLength) const {
    if (charLength < config_.ideal_min_chars) {
        return static_cast<double>(charLength) / static_cast<double>(config_.ideal_min_chars);
    }
    if (charLength > config_.ideal_max_chars) {
        return static_cast<double>(config_.ideal_max_chars) / static_cast<double>(charLength);
    }
    return 1.0;
}

std::vector<RetrievalCandidate> Reranker::rerank(std::string_view query,
                                                 std::vector<RetrievalCandidate> ranked,
                                                 size_t* droppedMalformed) const {
    if (ranked.size() > config_.top_n) {
        ranked.resize(config_.top_n);
    }

    const auto queryTokens = tokenSet(query);
    size_t dropped = 0;

    std::vector<RetrievalCandidate> out;
    out.reserve(ranked.size());
    for (auto& candidate : ranked) {
        const double score = config_.combined_weight * candidate.combined_score +
                             config_.keyword_weight * keywordOverlap(queryTokens, candidate.text) +
                             config_.position_weight * positionScore(candidate.chunk_index) +
                             config_.length_weight * lengthScore(utf8Length(candidate.text));
        if (!std::isfinite(score)) {
            spdlog::warn("Dropping candidate {}: non-finite rerank score", candidate.chunk_id);
            ++dropped;
            continue;
        }
        candidate.rerank_score = score;
        out.push_back(std::move(candidate));
    }

    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.rerank_score != b.rerank_score) {
            return a.rerank_score > b.rerank_score;
        }
        return candidateKeyLess(a, b);
    });

    if (droppedMalformed) {
        *droppedMalformed = dropped;
    }
    return out;
}

} // namespace ragcore::search
