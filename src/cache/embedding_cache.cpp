#include <ragcore/cache/embedding_cache.h>
#include <ragcore/crypto/hasher.h>

#include <spdlog/spdlog.h>

#include <cstring>

namespace ragcore::cache {

std::string encodeEmbedding(const Embedding& embedding) {
    std::string bytes(embedding.size() * sizeof(float), '\0');
    if (!embedding.empty()) {
        std::memcpy(bytes.data(), embedding.data(), bytes.size());
    }
    return bytes;
}

Result<Embedding> decodeEmbedding(std::string_view bytes) {
    if (bytes.empty() || bytes.size() % sizeof(float) != 0) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("embedding blob of {} bytes is not a float vector", bytes.size())};
    }
    Embedding embedding(bytes.size() / sizeof(float));
    std::memcpy(embedding.data(), bytes.data(), bytes.size());
    return embedding;
}

EmbeddingCache::EmbeddingCache(std::shared_ptr<CacheManager> manager)
    : manager_(std::move(manager)) {}

std::string EmbeddingCache::makeKey(std::string_view model, std::string_view text) {
    crypto::SHA256Hasher hasher;
    hasher.reset();
    hasher.update(model);
    hasher.update(std::string_view("\0", 1));
    hasher.update(text);
    return std::string(kEmbeddingNamespace) + hasher.finalize();
}

std::optional<Embedding> EmbeddingCache::get(std::string_view model, std::string_view text,
                                             size_t expectedDimension) {
    if (!manager_) {
        misses_.fetch_add(1);
        return std::nullopt;
    }
    auto key = makeKey(model, text);
    auto raw = manager_->get(key);
    if (!raw) {
        misses_.fetch_add(1);
        return std::nullopt;
    }

    auto decoded = decodeEmbedding(*raw);
    if (!decoded) {
        spdlog::warn("Dropping corrupt cached embedding {}: {}", key, decoded.error().message);
        manager_->invalidate(key);
        misses_.fetch_add(1);
        return std::nullopt;
    }
    if (expectedDimension != 0 && decoded.value().size() != expectedDimension) {
        spdlog::warn("Cached embedding {} has dimension {}, expected {}", key,
                     decoded.value().size(), expectedDimension);
        manager_->invalidate(key);
        misses_.fetch_add(1);
        return std::nullopt;
    }
    hits_.fetch_add(1);
    return std::move(decoded).value();
}

void EmbeddingCache::put(std::string_view model, std::string_view text,
                         const Embedding& embedding) {
    if (!manager_ || embedding.empty()) {
        return;
    }
    manager_->put(makeKey(model, text), encodeEmbedding(embedding));
}

} // namespace ragcore::cache
