#pragma once

#include "common/types.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations for OpenSSL types
typedef struct evp_md_ctx_st EVP_MD_CTX;
typedef struct evp_md_st EVP_MD;

namespace sdjwt::crypto {

// ============================================================================
// OpenSSL RAII Wrappers
// ============================================================================

struct EvpMdCtxDeleter { void operator()(EVP_MD_CTX* p) const; };

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// Error types
enum class CryptoError {
    INIT_FAILED,
    UNSUPPORTED_DIGEST,
    DIGEST_FAILED,
    HMAC_FAILED,
    KEY_GENERATION_FAILED,
    SIGN_FAILED,
};

std::string crypto_error_message(CryptoError error);

// Initialize libsodium. Safe to call from any thread, any number of times.
bool init();

// ============================================================================
// Hashing
// ============================================================================

// Digest algorithm names follow the IANA "Named Information Hash Algorithm"
// registry: sha-256, sha-384, sha-512, sha3-256, sha3-512.
bool is_supported_digest(std::string_view alg);

std::expected<Bytes, CryptoError> digest(
    std::string_view alg,
    std::span<const uint8_t> data);

// HMAC-SHA256 (used by the HS256 JWS algorithm)
std::expected<Bytes, CryptoError> hmac_sha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data);

// ============================================================================
// Random Generation
// ============================================================================

// Generate cryptographically secure random bytes
void random_bytes(std::span<uint8_t> buffer);

// Generate random bytes and return as vector
Bytes random_bytes(size_t length);

// Uniform integer in [0, upper_bound)
uint32_t random_uniform(uint32_t upper_bound);

// ============================================================================
// Utility Functions
// ============================================================================

// Constant-time memory comparison
bool secure_compare(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Secure memory wipe
void secure_wipe(std::span<uint8_t> memory);

} // namespace sdjwt::crypto
