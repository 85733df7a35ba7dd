#include <ragcore/vector/embedding_batcher.h>

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>

namespace ragcore::vector {

namespace {

size_t clampWorkers(size_t workers) {
    return std::max<size_t>(1, workers);
}

} // namespace

EmbeddingBatcher::EmbeddingBatcher(std::shared_ptr<IEmbedder> embedder,
                                   std::shared_ptr<cache::EmbeddingCache> cache,
                                   EmbeddingBatcherConfig config)
    : embedder_(std::move(embedder)), cache_(std::move(cache)), config_(config),
      pool_(clampWorkers(config.workers)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
}

EmbeddingBatcher::~EmbeddingBatcher() {
    pool_.join();
}

Result<Embedding> EmbeddingBatcher::computeChecked(const std::string& text) {
    if (!embedder_) {
        return Error{ErrorCode::EmbeddingUnavailable, "no embedder configured"};
    }
    try {
        auto result = embedder_->embed(text);
        if (!result) {
            return Error{ErrorCode::EmbeddingUnavailable, result.error().message};
        }
        const auto& vec = result.value();
        const size_t expected = embedder_->dimension();
        if (vec.empty() || (expected != 0 && vec.size() != expected)) {
            return Error{ErrorCode::EmbeddingUnavailable,
                         fmt::format("embedder returned {} values, expected {}", vec.size(),
                                     expected)};
        }
        if (!std::all_of(vec.begin(), vec.end(), [](float v) { return std::isfinite(v); })) {
            return Error{ErrorCode::EmbeddingUnavailable, "embedder returned non-finite values"};
        }
        return result;
    } catch (const std::exception& e) {
        return Error{ErrorCode::EmbeddingUnavailable, std::string("embedder threw: ") + e.what()};
    }
}

EmbeddedText EmbeddingBatcher::embedOne(const std::string& text) {
    EmbeddedText out;
    const auto model = embedder_ ? embedder_->modelName() : std::string{};
    const auto dimension = embedder_ ? embedder_->dimension() : 0;
    if (cache_) {
        if (auto cached = cache_->get(model, text, dimension)) {
            out.embedding = std::move(*cached);
            out.cache_hit = true;
            return out;
        }
    }
    out.embedding = computeChecked(text);
    if (out.embedding && cache_) {
        cache_->put(model, text, out.embedding.value());
    }
    return out;
}

std::vector<EmbeddedText> EmbeddingBatcher::embedAll(const std::vector<std::string>& texts,
                                                     BatchEmbeddingStats* stats) {
    std::vector<EmbeddedText> results(texts.size());
    std::vector<std::future<std::vector<EmbeddedText>>> pending;

    for (size_t begin = 0; begin < texts.size(); begin += config_.batch_size) {
        const size_t end = std::min(texts.size(), begin + config_.batch_size);
        pending.push_back(boost::asio::post(
            pool_, boost::asio::use_future([this, &texts, begin, end]() {
                std::vector<EmbeddedText> batch;
                batch.reserve(end - begin);
                for (size_t i = begin; i < end; ++i) {
                    auto item = embedOne(texts[i]);
                    item.index = i;
                    batch.push_back(std::move(item));
                }
                return batch;
            })));
    }

    BatchEmbeddingStats local;
    local.batches = pending.size();
    for (auto& future : pending) {
        for (auto& item : future.get()) {
            if (!item.embedding) {
                ++local.failures;
            } else if (item.cache_hit) {
                ++local.cache_hits;
            } else {
                ++local.computed;
            }
            const size_t index = item.index;
            results[index] = std::move(item);
        }
    }

    spdlog::debug("Embedded {} texts in {} batches ({} cached, {} failed)", texts.size(),
                  local.batches, local.cache_hits, local.failures);
    if (stats) {
        *stats = local;
    }
    return results;
}

} // namespace ragcore::vector
