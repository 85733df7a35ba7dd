#pragma once

#include <ragcore/core/types.h>
#include <ragcore/search/retrieval_candidate.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ragcore::search {

/**
 * @brief JSON form of a RetrievalResult as stored in the query-result cache.
 *
 * Candidates keep their order and every score. Trace counters are kept; timings and the
 * from_cache flag are not, since they describe a single request.
 */
nlohmann::json toJson(const RetrievalResult& result);
Result<RetrievalResult> fromJson(const nlohmann::json& j);

std::string encodeResult(const RetrievalResult& result);
Result<RetrievalResult> decodeResult(std::string_view data);

} // namespace ragcore::search
