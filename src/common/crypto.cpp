#include "common/crypto.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sodium.h>
#include <array>
#include <mutex>

namespace sdjwt::crypto {

void EvpMdCtxDeleter::operator()(EVP_MD_CTX* p) const {
    EVP_MD_CTX_free(p);
}

std::string crypto_error_message(CryptoError error) {
    switch (error) {
        case CryptoError::INIT_FAILED: return "Crypto initialization failed";
        case CryptoError::UNSUPPORTED_DIGEST: return "Unsupported digest algorithm";
        case CryptoError::DIGEST_FAILED: return "Digest computation failed";
        case CryptoError::HMAC_FAILED: return "HMAC computation failed";
        case CryptoError::KEY_GENERATION_FAILED: return "Key generation failed";
        case CryptoError::SIGN_FAILED: return "Signing failed";
        default: return "Unknown crypto error";
    }
}

bool init() {
    static std::once_flag flag;
    static bool ok = false;
    std::call_once(flag, [] { ok = sodium_init() >= 0; });
    return ok;
}

// ============================================================================
// Hashing
// ============================================================================

namespace {

const EVP_MD* digest_by_name(std::string_view alg) {
    if (alg == "sha-256") return EVP_sha256();
    if (alg == "sha-384") return EVP_sha384();
    if (alg == "sha-512") return EVP_sha512();
    if (alg == "sha3-256") return EVP_sha3_256();
    if (alg == "sha3-512") return EVP_sha3_512();
    return nullptr;
}

} // anonymous namespace

bool is_supported_digest(std::string_view alg) {
    return digest_by_name(alg) != nullptr;
}

std::expected<Bytes, CryptoError> digest(
    std::string_view alg,
    std::span<const uint8_t> data) {

    const EVP_MD* md = digest_by_name(alg);
    if (!md) {
        return std::unexpected(CryptoError::UNSUPPORTED_DIGEST);
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::unexpected(CryptoError::DIGEST_FAILED);
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        return std::unexpected(CryptoError::DIGEST_FAILED);
    }

    return Bytes(out.begin(), out.begin() + out_len);
}

std::expected<Bytes, CryptoError> hmac_sha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {

    std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;

    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              data.data(), data.size(),
              out.data(), &out_len)) {
        return std::unexpected(CryptoError::HMAC_FAILED);
    }

    return Bytes(out.begin(), out.begin() + out_len);
}

// ============================================================================
// Random Generation
// ============================================================================

void random_bytes(std::span<uint8_t> buffer) {
    init();
    randombytes_buf(buffer.data(), buffer.size());
}

Bytes random_bytes(size_t length) {
    Bytes buffer(length);
    random_bytes(std::span<uint8_t>(buffer));
    return buffer;
}

uint32_t random_uniform(uint32_t upper_bound) {
    init();
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Utility Functions
// ============================================================================

bool secure_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secure_wipe(std::span<uint8_t> memory) {
    sodium_memzero(memory.data(), memory.size());
}

} // namespace sdjwt::crypto
