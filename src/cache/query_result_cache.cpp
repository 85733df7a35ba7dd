#include <ragcore/cache/query_result_cache.h>
#include <ragcore/crypto/hasher.h>
#include <ragcore/search/result_codec.h>

#include <spdlog/spdlog.h>

namespace ragcore::cache {

QueryResultCache::QueryResultCache(std::shared_ptr<CacheManager> manager)
    : manager_(std::move(manager)) {}

std::string QueryResultCache::makeKey(std::string_view normalizedQuery, std::string_view scope) {
    crypto::SHA256Hasher hasher;
    hasher.reset();
    hasher.update(normalizedQuery);
    hasher.update(std::string_view("\0", 1));
    hasher.update(scope);
    return std::string(kQueryNamespace) + hasher.finalize();
}

std::optional<search::RetrievalResult> QueryResultCache::get(const std::string& key) {
    if (!manager_) {
        return std::nullopt;
    }
    auto raw = manager_->get(key);
    if (!raw) {
        return std::nullopt;
    }
    auto decoded = search::decodeResult(*raw);
    if (!decoded) {
        spdlog::warn("Dropping unreadable cached result {}: {}", key, decoded.error().message);
        manager_->invalidate(key);
        return std::nullopt;
    }
    auto result = std::move(decoded).value();
    result.from_cache = true;
    return result;
}

void QueryResultCache::put(const std::string& key, const search::RetrievalResult& result,
                           const std::string& label) {
    if (!manager_) {
        return;
    }
    manager_->put(key, search::encodeResult(result), label);
}

size_t QueryResultCache::invalidateAll() {
    return manager_ ? manager_->invalidateNamespace(kQueryNamespace) : 0;
}

} // namespace ragcore::cache
