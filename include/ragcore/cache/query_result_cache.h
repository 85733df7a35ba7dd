#pragma once

#include <ragcore/cache/cache_manager.h>
#include <ragcore/search/retrieval_candidate.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ragcore::cache {

/**
 * @brief Caches complete retrieval results under the "query:" namespace.
 *
 * The key covers the normalized query text and a scope string describing everything else
 * that changes the answer (filter and ranking parameters). The query text is the L3 label,
 * which makes cached queries visible to topQueries().
 */
class QueryResultCache {
public:
    explicit QueryResultCache(std::shared_ptr<CacheManager> manager);

    static std::string makeKey(std::string_view normalizedQuery, std::string_view scope);

    std::optional<search::RetrievalResult> get(const std::string& key);
    void put(const std::string& key, const search::RetrievalResult& result,
             const std::string& label);

    /**
     * @brief Drop every cached result; called when the corpus changes.
     */
    size_t invalidateAll();

private:
    std::shared_ptr<CacheManager> manager_;
};

} // namespace ragcore::cache
