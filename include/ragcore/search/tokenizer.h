#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ragcore::search {

/**
 * @brief Split text into lowercase word tokens.
 *
 * ASCII letters are lowercased and ASCII non-alphanumerics separate tokens. Bytes >= 0x80 are
 * treated as word characters so UTF-8 words are kept whole.
 */
std::vector<std::string> tokenize(std::string_view text);

/**
 * @brief Unique tokens of text.
 */
std::unordered_set<std::string> tokenSet(std::string_view text);

/**
 * @brief Jaccard similarity |A n B| / |A u B| of two token sets; 0 when both are empty.
 */
double jaccardSimilarity(const std::unordered_set<std::string>& a,
                         const std::unordered_set<std::string>& b);

} // namespace ragcore::search
