#include "common/encoding.hpp"
#include "common/crypto.hpp"
#include <sodium.h>

namespace sdjwt {

namespace {
constexpr int VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
}

std::string base64url_encode(std::span<const uint8_t> data) {
    crypto::init();
    size_t b64_len = sodium_base64_encoded_len(data.size(), VARIANT);
    std::string buf(b64_len, '\0');
    sodium_bin2base64(buf.data(), b64_len, data.data(), data.size(), VARIANT);
    // Remove null terminator
    buf.resize(b64_len - 1);
    return buf;
}

std::string base64url_encode(std::string_view str) {
    return base64url_encode(as_bytes(str));
}

std::optional<Bytes> base64url_decode(std::string_view encoded) {
    crypto::init();
    Bytes out(encoded.size() * 3 / 4 + 1);
    size_t bin_len = 0;
    const char* end = nullptr;

    int ret = sodium_base642bin(out.data(), out.size(),
                                encoded.data(), encoded.size(),
                                nullptr, &bin_len, &end, VARIANT);
    if (ret != 0 || end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }

    out.resize(bin_len);
    return out;
}

std::optional<std::string> base64url_decode_string(std::string_view encoded) {
    auto bytes = base64url_decode(encoded);
    if (!bytes) return std::nullopt;
    return std::string(bytes->begin(), bytes->end());
}

} // namespace sdjwt
