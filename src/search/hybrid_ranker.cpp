#include <ragcore/search/hybrid_ranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace ragcore::search {

namespace {

// Min-max scale into [0, 1]; a flat signal maps to 1.0 if positive, else 0.0
std::vector<double> minMaxNormalize(const std::vector<double>& values) {
    std::vector<double> out(values.size(), 0.0);
    if (values.empty()) {
        return out;
    }
    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    const double lo = *minIt;
    const double hi = *maxIt;
    const double range = hi - lo;
    for (size_t i = 0; i < values.size(); ++i) {
        if (range <= 0.0) {
            out[i] = hi > 0.0 ? 1.0 : 0.0;
        } else {
            out[i] = (values[i] - lo) / range;
        }
    }
    return out;
}

} // namespace

Result<void> HybridRankerConfig::validate() const {
    if (semantic_weight < 0.0 || semantic_weight > 1.0 || bm25_weight < 0.0 ||
        bm25_weight > 1.0) {
        return Error{ErrorCode::ValidationError, "ranking weights must be within [0, 1]"};
    }
    if (std::abs(semantic_weight + bm25_weight - 1.0) > 1e-6) {
        return Error{ErrorCode::ValidationError, "semantic_weight + bm25_weight must equal 1.0"};
    }
    if (!(min_similarity >= 0.0 && min_similarity <= 1.0)) {
        return Error{ErrorCode::ValidationError, "min_similarity must be within [0, 1]"};
    }
    return {};
}

double normalizeCosine(double cosine) {
    if (!std::isfinite(cosine)) {
        return cosine;
    }
    return std::clamp(cosine, 0.0, 1.0);
}

Result<void> checkCandidate(const RetrievalCandidate& candidate) {
    if (candidate.text.empty()) {
        return Error{ErrorCode::MalformedCandidate, "empty text for " + candidate.chunk_id};
    }
    if (!std::isfinite(candidate.similarity_score) || candidate.similarity_score < 0.0 ||
        candidate.similarity_score > 1.0) {
        return Error{ErrorCode::MalformedCandidate,
                     "similarity out of range for " + candidate.chunk_id};
    }
    if (!std::isfinite(candidate.bm25_score) || candidate.bm25_score < 0.0) {
        return Error{ErrorCode::MalformedCandidate, "invalid bm25 score for " + candidate.chunk_id};
    }
    return {};
}

HybridRanker::HybridRanker(HybridRankerConfig config) : config_(config) {
    config_.normalizeWeights();
}

std::vector<RetrievalCandidate> HybridRanker::rank(std::vector<RetrievalCandidate> candidates,
                                                   HybridRankStats* stats) const {
    HybridRankStats local;

    std::vector<RetrievalCandidate> pool;
    pool.reserve(candidates.size());
    for (auto& candidate : candidates) {
        if (auto check = checkCandidate(candidate); !check) {
            spdlog::warn("Dropping candidate: {}", check.error().message);
            ++local.dropped_malformed;
            continue;
        }
        if (candidate.similarity_score < config_.min_similarity) {
            ++local.dropped_below_threshold;
            continue;
        }
        pool.push_back(std::move(candidate));
    }

    std::vector<double> similarities;
    std::vector<double> bm25;
    similarities.reserve(pool.size());
    bm25.reserve(pool.size());
    for (const auto& c : pool) {
        similarities.push_back(c.similarity_score);
        bm25.push_back(c.bm25_score);
    }
    auto normSim = minMaxNormalize(similarities);
    auto normBm25 = minMaxNormalize(bm25);

    for (size_t i = 0; i < pool.size(); ++i) {
        pool[i].combined_score =
            config_.semantic_weight * normSim[i] + config_.bm25_weight * normBm25[i];
    }

    std::sort(pool.begin(), pool.end(), [](const auto& a, const auto& b) {
        if (a.combined_score != b.combined_score) {
            return a.combined_score > b.combined_score;
        }
        return candidateKeyLess(a, b);
    });

    if (stats) {
        *stats = local;
    }
    return pool;
}

} // namespace ragcore::search
