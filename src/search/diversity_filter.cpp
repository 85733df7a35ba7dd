#include <ragcore/search/diversity_filter.h>
#include <ragcore/search/tokenizer.h>

#include <spdlog/spdlog.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>

namespace ragcore::search {

Result<void> DiversityConfig::validate() const {
    if (final_top_k == 0 || final_top_k > 50) {
        return Error{ErrorCode::ValidationError, "final_top_k must be within [1, 50]"};
    }
    if (!(diversity_threshold >= 0.0 && diversity_threshold <= 1.0)) {
        return Error{ErrorCode::ValidationError, "diversity_threshold must be within [0, 1]"};
    }
    return {};
}

DiversityFilter::DiversityFilter(DiversityConfig config) : config_(config) {}

std::vector<RetrievalCandidate>
DiversityFilter::filter(const std::vector<RetrievalCandidate>& ranked,
                        DiversityStats* stats) const {
    DiversityStats local;
    std::set<std::pair<std::string, size_t>> keys;
    // Per file: accepted indices plus indices rejected for adjacency, so a run of
    // overlapping neighbours collapses onto its best-ranked member
    std::map<std::string, std::set<size_t>> blocked;
    std::vector<std::unordered_set<std::string>> acceptedTokens;
    std::vector<RetrievalCandidate> out;

    auto nearBlocked = [&](const RetrievalCandidate& c) {
        auto it = blocked.find(c.filename);
        if (it == blocked.end()) {
            return false;
        }
        const size_t window = config_.adjacency_window;
        auto lo = it->second.lower_bound(c.chunk_index > window ? c.chunk_index - window : 0);
        return lo != it->second.end() && *lo <= c.chunk_index + window;
    };

    auto classify = [&](const RetrievalCandidate& c,
                        const std::unordered_set<std::string>& tokens) -> std::optional<RejectReason> {
        if (keys.count({c.filename, c.chunk_index})) {
            return RejectReason::Duplicate;
        }
        if (nearBlocked(c)) {
            return RejectReason::Adjacent;
        }
        for (const auto& other : acceptedTokens) {
            if (jaccardSimilarity(tokens, other) > config_.diversity_threshold) {
                return RejectReason::Similar;
            }
        }
        return std::nullopt;
    };

    for (const auto& candidate : ranked) {
        if (out.size() >= config_.final_top_k) {
            break;
        }
        auto tokens = tokenSet(candidate.text);
        auto reason = classify(candidate, tokens);
        if (!reason) {
            keys.emplace(candidate.filename, candidate.chunk_index);
            blocked[candidate.filename].insert(candidate.chunk_index);
            acceptedTokens.push_back(std::move(tokens));
            out.push_back(candidate);
            continue;
        }
        switch (*reason) {
            case RejectReason::Duplicate:
                ++local.duplicate;
                break;
            case RejectReason::Adjacent:
                blocked[candidate.filename].insert(candidate.chunk_index);
                ++local.adjacent;
                break;
            case RejectReason::Similar:
                ++local.similar;
                break;
        }
        spdlog::debug("Diversity filter rejected {}#{}", candidate.filename,
                      candidate.chunk_index);
    }

    if (stats) {
        *stats = local;
    }
    return out;
}

} // namespace ragcore::search
