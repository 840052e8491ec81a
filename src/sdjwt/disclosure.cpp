#include "sdjwt/disclosure.hpp"
#include "common/crypto.hpp"
#include "common/encoding.hpp"
#include "common/logger.hpp"

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.disclosure"); }
} // anonymous namespace

bool is_reserved_claim_name(std::string_view name) {
    return name == format::SD_DIGESTS_KEY ||
           name == format::SD_ALG_KEY ||
           name == format::ARRAY_DIGEST_KEY;
}

std::string generate_salt() {
    return base64url_encode(crypto::random_bytes(crypto::SALT_SIZE));
}

std::expected<std::string, ErrorCode> digest_of(std::string_view encoded, std::string_view alg) {
    auto hash = crypto::digest(alg, as_bytes(encoded));
    if (!hash) {
        if (hash.error() == crypto::CryptoError::UNSUPPORTED_DIGEST) {
            log().warn("Unsupported digest algorithm: {}", alg);
            return std::unexpected(ErrorCode::UNSUPPORTED_ALGORITHM);
        }
        log().error("Digest computation failed: {}", crypto::crypto_error_message(hash.error()));
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }
    return base64url_encode(*hash);
}

std::expected<Disclosure, ErrorCode> make_disclosure(
    std::string salt,
    std::optional<std::string> key,
    json::value value,
    std::string_view alg) {

    if (key && is_reserved_claim_name(*key)) {
        log().warn("Refusing to create disclosure for reserved name {}", *key);
        return std::unexpected(ErrorCode::POLICY_ERROR);
    }

    json::array arr;
    arr.emplace_back(salt);
    if (key) {
        arr.emplace_back(*key);
    }
    arr.push_back(value);

    Disclosure d;
    d.encoded = base64url_encode(json::serialize(arr));

    auto digest = digest_of(d.encoded, alg);
    if (!digest) {
        return std::unexpected(digest.error());
    }

    d.salt = std::move(salt);
    d.key = std::move(key);
    d.value = std::move(value);
    d.digest = std::move(*digest);
    return d;
}

std::expected<Disclosure, ErrorCode> parse_disclosure(std::string_view encoded, std::string_view alg) {
    auto decoded = base64url_decode_string(encoded);
    if (!decoded) {
        log().debug("Disclosure is not valid base64url");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    json::error_code ec;
    json::value jv = json::parse(json::string_view(decoded->data(), decoded->size()), ec);
    if (ec || !jv.is_array()) {
        log().debug("Disclosure is not a JSON array");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    auto& arr = jv.as_array();
    if ((arr.size() != 2 && arr.size() != 3) || !arr[0].is_string()) {
        log().debug("Disclosure array has {} elements", arr.size());
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    Disclosure d;
    d.salt = std::string(arr[0].as_string());
    if (arr.size() == 3) {
        if (!arr[1].is_string()) {
            log().debug("Disclosure claim name is not a string");
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }
        d.key = std::string(arr[1].as_string());
        if (is_reserved_claim_name(*d.key)) {
            log().warn("Disclosure uses reserved claim name {}", *d.key);
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }
        d.value = std::move(arr[2]);
    } else {
        d.value = std::move(arr[1]);
    }

    auto digest = digest_of(encoded, alg);
    if (!digest) {
        return std::unexpected(digest.error());
    }

    d.encoded = std::string(encoded);
    d.digest = std::move(*digest);
    return d;
}

std::expected<std::string, ErrorCode> make_decoy_digest(std::string_view alg) {
    return digest_of(generate_salt(), alg);
}

} // namespace sdjwt
