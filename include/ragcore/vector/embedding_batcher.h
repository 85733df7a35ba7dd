#pragma once

#include <ragcore/cache/embedding_cache.h>
#include <ragcore/core/types.h>
#include <ragcore/vector/embedder.h>

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <string>
#include <vector>

namespace ragcore::vector {

struct EmbeddingBatcherConfig {
    size_t batch_size = 64; ///< Texts per pool task
    size_t workers = 8;     ///< Pool threads
};

/**
 * @brief Outcome for one input text; position matches the input order.
 */
struct EmbeddedText {
    size_t index = 0;
    Result<Embedding> embedding{ErrorCode::NotInitialized};
    bool cache_hit = false;
};

struct BatchEmbeddingStats {
    size_t batches = 0;
    size_t cache_hits = 0;
    size_t computed = 0;
    size_t failures = 0;
};

/**
 * @brief Embeds many texts on a bounded worker pool, consulting the embedding cache first.
 *
 * Texts are split into batches of batch_size, each batch runs as one pool task. Completion
 * order is arbitrary but every outcome carries its source index, and the returned vector is
 * indexed like the input. Freshly computed vectors are cached before they are returned.
 */
class EmbeddingBatcher {
public:
    EmbeddingBatcher(std::shared_ptr<IEmbedder> embedder,
                     std::shared_ptr<cache::EmbeddingCache> cache,
                     EmbeddingBatcherConfig config = {});
    ~EmbeddingBatcher();

    EmbeddingBatcher(const EmbeddingBatcher&) = delete;
    EmbeddingBatcher& operator=(const EmbeddingBatcher&) = delete;

    std::vector<EmbeddedText> embedAll(const std::vector<std::string>& texts,
                                       BatchEmbeddingStats* stats = nullptr);

    /**
     * @brief Embed a single text on the calling thread, cache first.
     */
    EmbeddedText embedOne(const std::string& text);

    const EmbeddingBatcherConfig& config() const { return config_; }

private:
    Result<Embedding> computeChecked(const std::string& text);

    std::shared_ptr<IEmbedder> embedder_;
    std::shared_ptr<cache::EmbeddingCache> cache_;
    EmbeddingBatcherConfig config_;
    boost::asio::thread_pool pool_;
};

} // namespace ragcore::vector
