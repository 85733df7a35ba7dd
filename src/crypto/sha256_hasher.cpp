#include <ragcore/crypto/hasher.h>

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace ragcore::crypto {

namespace {

constexpr size_t kDigestBytes = 32;
constexpr std::string_view kHexDigits = "0123456789abcdef";

void check(int rc, const char* step) {
    if (rc != 1) {
        throw std::runtime_error(std::string("SHA-256 ") + step + " failed");
    }
}

} // namespace

void SHA256Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

SHA256Hasher::SHA256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new returned null");
    }
    reset();
}

SHA256Hasher::~SHA256Hasher() = default;
SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::reset() {
    check(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), "init");
}

void SHA256Hasher::update(std::span<const std::byte> data) {
    if (data.empty()) {
        return;
    }
    check(EVP_DigestUpdate(ctx_.get(), data.data(), data.size()), "update");
}

void SHA256Hasher::update(std::string_view text) {
    update(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, kDigestBytes> digest{};
    check(EVP_DigestFinal_ex(ctx_.get(), digest.data(), nullptr), "final");

    std::string hex(kDigestBytes * 2, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
        hex[2 * i] = kHexDigits[digest[i] >> 4];
        hex[2 * i + 1] = kHexDigits[digest[i] & 0x0F];
    }
    reset();
    return hex;
}

std::string SHA256Hasher::hash(std::span<const std::byte> data) {
    SHA256Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string SHA256Hasher::hashString(std::string_view text) {
    return hash(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

} // namespace ragcore::crypto
