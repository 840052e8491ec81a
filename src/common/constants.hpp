#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sdjwt {

// ============================================================================
// SD-JWT wire format
// ============================================================================
namespace format {

// Separator between the JWS, the disclosures and the holder binding JWT
inline constexpr char COMBINED_SEPARATOR = '~';

// Reserved claim names
inline constexpr std::string_view SD_DIGESTS_KEY = "_sd";
inline constexpr std::string_view SD_ALG_KEY = "_sd_alg";
inline constexpr std::string_view ARRAY_DIGEST_KEY = "...";
inline constexpr std::string_view CNF_KEY = "cnf";
inline constexpr std::string_view JWK_KEY = "jwk";

// JOSE header types
inline constexpr std::string_view SD_JWT_TYP = "example+sd-jwt";
inline constexpr std::string_view BINDING_JWT_TYP = "kb+jwt";

// Default digest algorithm (IANA Named Information Hash Algorithm registry)
inline constexpr std::string_view DEFAULT_DIGEST_ALG = "sha-256";

}  // namespace format

// ============================================================================
// Key sizes
// ============================================================================
namespace crypto {

inline constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
inline constexpr size_t ED25519_PRIVATE_KEY_SIZE = 64;
inline constexpr size_t ED25519_SEED_SIZE = 32;
inline constexpr size_t ED25519_SIGNATURE_SIZE = 64;
inline constexpr size_t HMAC_SHA256_SIZE = 32;

// 128 bits of entropy per disclosure salt
inline constexpr size_t SALT_SIZE = 16;

}  // namespace crypto

// ============================================================================
// Defaults
// ============================================================================
namespace defaults {

// Verifier clock tolerance for iat/nbf/exp
inline constexpr auto CLOCK_SKEW = std::chrono::seconds(60);

// Maximum accepted age of a holder binding JWT
inline constexpr auto MAX_BINDING_AGE = std::chrono::minutes(5);

// Decoy range used by RandomDecoys when nothing else is configured
inline constexpr size_t DECOY_MIN_ELEMENTS = 2;
inline constexpr size_t DECOY_MAX_ELEMENTS = 5;

// File looked up in each subdirectory when no test cases are named
inline constexpr std::string_view TEST_CASE_FILE_NAME = "specification.json";

}  // namespace defaults

}  // namespace sdjwt
