#pragma once

#include "common/types.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sdjwt {

// Base64URL (RFC 4648 section 5) without padding
std::string base64url_encode(std::span<const uint8_t> data);
std::string base64url_encode(std::string_view str);

// Strict decoding: padding, whitespace and the standard alphabet are rejected
std::optional<Bytes> base64url_decode(std::string_view encoded);
std::optional<std::string> base64url_decode_string(std::string_view encoded);

inline std::span<const uint8_t> as_bytes(std::string_view str) {
    return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

} // namespace sdjwt
