#pragma once

#include <ragcore/cache/cache_manager.h>
#include <ragcore/core/types.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ragcore::cache {

/**
 * @brief Content-addressed embedding cache on top of CacheManager.
 *
 * Keys are "emb:" followed by the SHA-256 of the model name and text, so an entry stays valid
 * for as long as the model does, whichever document the text came from. Vectors are stored
 * as raw float bytes in host order.
 */
class EmbeddingCache {
public:
    explicit EmbeddingCache(std::shared_ptr<CacheManager> manager);

    static std::string makeKey(std::string_view model, std::string_view text);

    /**
     * @brief Cached vector for text, or std::nullopt on miss.
     * @param expectedDimension when non-zero, a stored vector of another size is a miss
     */
    std::optional<Embedding> get(std::string_view model, std::string_view text,
                                 size_t expectedDimension = 0);

    void put(std::string_view model, std::string_view text, const Embedding& embedding);

    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

private:
    std::shared_ptr<CacheManager> manager_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

std::string encodeEmbedding(const Embedding& embedding);
Result<Embedding> decodeEmbedding(std::string_view bytes);

} // namespace ragcore::cache
