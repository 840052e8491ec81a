#pragma once

#include "common/jws.hpp"
#include "common/types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace sdjwt {

// ============================================================================
// Disclosure
// ============================================================================
// One selectively disclosable claim: [salt, key, value] for an object member,
// [salt, value] for an array element. `encoded` is the base64url form that
// travels in the combined artifact and `digest` is computed over exactly
// those characters, so a parsed disclosure hashes what was received.

struct Disclosure {
    std::string salt;
    std::optional<std::string> key;
    json::value value;
    std::string encoded;
    std::string digest;

    bool is_array_element() const { return !key.has_value(); }
};

// Reserved names that may never be disclosed as a claim name
bool is_reserved_claim_name(std::string_view name);

// 128-bit random salt, base64url encoded
std::string generate_salt();

// b64url(hash(ascii(encoded)))
std::expected<std::string, ErrorCode> digest_of(std::string_view encoded, std::string_view alg);

// Pure and deterministic for a given salt
std::expected<Disclosure, ErrorCode> make_disclosure(
    std::string salt,
    std::optional<std::string> key,
    json::value value,
    std::string_view alg);

std::expected<Disclosure, ErrorCode> parse_disclosure(std::string_view encoded, std::string_view alg);

// Digest over a fresh random salt; never backed by a disclosure
std::expected<std::string, ErrorCode> make_decoy_digest(std::string_view alg);

} // namespace sdjwt
