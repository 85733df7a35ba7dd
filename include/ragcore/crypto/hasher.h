#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace ragcore::crypto {

/**
 * @brief Incremental SHA-256 over OpenSSL EVP, producing lowercase hex digests.
 *
 * A hasher is ready for input on construction and again after each finalize(). Not
 * thread-safe.
 */
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    // Discards any input fed since the last digest
    void reset();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);
    std::string finalize();

    static std::string hash(std::span<const std::byte> data);
    static std::string hashString(std::string_view text);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

} // namespace ragcore::crypto
