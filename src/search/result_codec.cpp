#include <ragcore/search/result_codec.h>

namespace ragcore::search {

namespace {
constexpr int kCodecVersion = 1;
}

nlohmann::json toJson(const RetrievalResult& result) {
    nlohmann::json candidates = nlohmann::json::array();
    for (const auto& c : result.candidates) {
        candidates.push_back({{"chunk_id", c.chunk_id},
                              {"document_id", c.document_id},
                              {"filename", c.filename},
                              {"chunk_index", c.chunk_index},
                              {"text", c.text},
                              {"similarity", c.similarity_score},
                              {"bm25", c.bm25_score},
                              {"combined", c.combined_score},
                              {"rerank", c.rerank_score}});
    }

    const auto& t = result.trace;
    return {{"version", kCodecVersion},
            {"candidates", std::move(candidates)},
            {"trace",
             {{"candidates_found", t.candidates_found},
              {"dropped_malformed", t.dropped_malformed},
              {"dropped_below_threshold", t.dropped_below_threshold},
              {"rejected_duplicate", t.rejected_duplicate},
              {"rejected_adjacent", t.rejected_adjacent},
              {"rejected_similar", t.rejected_similar}}}};
}

Result<RetrievalResult> fromJson(const nlohmann::json& j) {
    try {
        if (j.value("version", 0) != kCodecVersion) {
            return Error{ErrorCode::InvalidData, "unsupported cached result version"};
        }

        RetrievalResult result;
        for (const auto& c : j.at("candidates")) {
            RetrievalCandidate candidate;
            candidate.chunk_id = c.at("chunk_id").get<std::string>();
            candidate.document_id = c.at("document_id").get<DocumentId>();
            candidate.filename = c.at("filename").get<std::string>();
            candidate.chunk_index = c.at("chunk_index").get<size_t>();
            candidate.text = c.at("text").get<std::string>();
            candidate.similarity_score = c.at("similarity").get<double>();
            candidate.bm25_score = c.at("bm25").get<double>();
            candidate.combined_score = c.at("combined").get<double>();
            candidate.rerank_score = c.at("rerank").get<double>();
            result.candidates.push_back(std::move(candidate));
        }

        if (j.contains("trace")) {
            const auto& t = j["trace"];
            result.trace.candidates_found = t.value("candidates_found", size_t{0});
            result.trace.dropped_malformed = t.value("dropped_malformed", size_t{0});
            result.trace.dropped_below_threshold = t.value("dropped_below_threshold", size_t{0});
            result.trace.rejected_duplicate = t.value("rejected_duplicate", size_t{0});
            result.trace.rejected_adjacent = t.value("rejected_adjacent", size_t{0});
            result.trace.rejected_similar = t.value("rejected_similar", size_t{0});
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed cached result: ") + e.what()};
    }
}

std::string encodeResult(const RetrievalResult& result) {
    return toJson(result).dump();
}

Result<RetrievalResult> decodeResult(std::string_view data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::InvalidData, "cached result is not valid JSON"};
    }
    return fromJson(j);
}

} // namespace ragcore::search
