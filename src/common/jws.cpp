#include "common/jws.hpp"
#include "common/encoding.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <vector>

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.jws"); }

std::string json_string_field(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return {};
}
} // anonymous namespace

std::optional<json::object> parse_json_object(std::string_view text) {
    json::error_code ec;
    json::value jv = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec || !jv.is_object()) {
        return std::nullopt;
    }
    return std::move(jv.as_object());
}

// ============================================================================
// Ed25519
// ============================================================================

Ed25519Verifier::Ed25519Verifier(const crypto::Ed25519PublicKey& public_key)
    : public_key_(public_key) {}

bool Ed25519Verifier::verify(std::span<const uint8_t> data,
                             std::span<const uint8_t> signature) const {
    return crypto::Ed25519::verify(public_key_, data, signature);
}

json::object Ed25519Verifier::jwk() const {
    json::object jwk;
    jwk["kty"] = "OKP";
    jwk["crv"] = "Ed25519";
    jwk["x"] = base64url_encode(std::span<const uint8_t>(public_key_));
    return jwk;
}

Ed25519Signer::Ed25519Signer(const crypto::Ed25519PrivateKey& private_key)
    : private_key_(private_key) {}

Ed25519Signer::~Ed25519Signer() {
    crypto::secure_wipe(private_key_);
}

std::expected<std::unique_ptr<Ed25519Signer>, ErrorCode> Ed25519Signer::generate() {
    auto kp = crypto::Ed25519::generate_keypair();
    if (!kp) {
        log().error("Ed25519 key generation failed: {}", crypto::crypto_error_message(kp.error()));
        return std::unexpected(ErrorCode::SIGNING_ERROR);
    }
    return std::make_unique<Ed25519Signer>(kp->second);
}

std::expected<std::unique_ptr<Ed25519Signer>, ErrorCode> Ed25519Signer::from_seed(
    const crypto::Ed25519Seed& seed) {
    auto kp = crypto::Ed25519::keypair_from_seed(seed);
    if (!kp) {
        log().error("Ed25519 seed key derivation failed: {}", crypto::crypto_error_message(kp.error()));
        return std::unexpected(ErrorCode::SIGNING_ERROR);
    }
    return std::make_unique<Ed25519Signer>(kp->second);
}

std::expected<Bytes, ErrorCode> Ed25519Signer::sign(std::span<const uint8_t> data) const {
    auto sig = crypto::Ed25519::sign(private_key_, data);
    if (!sig) {
        log().error("Ed25519 signing failed: {}", crypto::crypto_error_message(sig.error()));
        return std::unexpected(ErrorCode::SIGNING_ERROR);
    }
    return Bytes(sig->begin(), sig->end());
}

std::optional<json::object> Ed25519Signer::public_jwk() const {
    return verifier()->jwk();
}

std::shared_ptr<Ed25519Verifier> Ed25519Signer::verifier() const {
    return std::make_shared<Ed25519Verifier>(crypto::Ed25519::public_key_from_private(private_key_));
}

// ============================================================================
// HS256
// ============================================================================

HmacSigner::HmacSigner(Bytes secret) : secret_(std::move(secret)) {}

HmacSigner::~HmacSigner() {
    crypto::secure_wipe(secret_);
}

std::expected<Bytes, ErrorCode> HmacSigner::sign(std::span<const uint8_t> data) const {
    auto mac = crypto::hmac_sha256(secret_, data);
    if (!mac) {
        log().error("HMAC signing failed: {}", crypto::crypto_error_message(mac.error()));
        return std::unexpected(ErrorCode::SIGNING_ERROR);
    }
    return std::move(*mac);
}

HmacVerifier::HmacVerifier(Bytes secret) : secret_(std::move(secret)) {}

HmacVerifier::~HmacVerifier() {
    crypto::secure_wipe(secret_);
}

bool HmacVerifier::verify(std::span<const uint8_t> data,
                          std::span<const uint8_t> signature) const {
    auto mac = crypto::hmac_sha256(secret_, data);
    if (!mac) return false;
    return crypto::secure_compare(*mac, signature);
}

std::expected<std::shared_ptr<const SignatureVerifier>, ErrorCode> verifier_from_jwk(
    const json::object& jwk) {

    auto kty = json_string_field(jwk, "kty");
    auto crv = json_string_field(jwk, "crv");

    if (kty != "OKP" || crv != "Ed25519") {
        log().warn("Unsupported JWK type: kty={} crv={}", kty, crv);
        return std::unexpected(ErrorCode::UNSUPPORTED_ALGORITHM);
    }

    auto x = base64url_decode(json_string_field(jwk, "x"));
    if (!x || x->size() != crypto::ED25519_PUBLIC_KEY_SIZE) {
        log().warn("Malformed Ed25519 JWK");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    crypto::Ed25519PublicKey pub;
    std::copy(x->begin(), x->end(), pub.begin());
    return std::make_shared<const Ed25519Verifier>(pub);
}

// ============================================================================
// Jws
// ============================================================================

std::expected<Jws, ErrorCode> Jws::sign(
    const json::object& payload,
    const Signer& signer,
    std::string_view typ,
    const json::object& extra_header) {

    Jws jws;

    jws.header["alg"] = std::string(signer.algorithm());
    jws.header["typ"] = std::string(typ);
    for (const auto& kv : extra_header) {
        if (kv.key() == "alg") continue;
        jws.header[kv.key()] = kv.value();
    }
    jws.payload = payload;

    std::string header_b64 = base64url_encode(json::serialize(jws.header));
    std::string payload_b64 = base64url_encode(json::serialize(jws.payload));
    jws.signing_input = header_b64 + "." + payload_b64;

    auto signature = signer.sign(as_bytes(jws.signing_input));
    if (!signature) {
        return std::unexpected(signature.error());
    }
    jws.signature = std::move(*signature);
    jws.serialized = jws.signing_input + "." + base64url_encode(jws.signature);

    return jws;
}

std::expected<Jws, ErrorCode> Jws::parse(std::string_view compact) {
    auto first = compact.find('.');
    if (first == std::string_view::npos) {
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }
    auto second = compact.find('.', first + 1);
    if (second == std::string_view::npos ||
        compact.find('.', second + 1) != std::string_view::npos) {
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    auto header_json = base64url_decode_string(compact.substr(0, first));
    auto payload_json = base64url_decode_string(compact.substr(first + 1, second - first - 1));
    auto signature = base64url_decode(compact.substr(second + 1));
    if (!header_json || !payload_json || !signature || signature->empty()) {
        log().debug("JWS segment is not valid base64url");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    auto header = parse_json_object(*header_json);
    auto payload = parse_json_object(*payload_json);
    if (!header || !payload) {
        log().debug("JWS header or payload is not a JSON object");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    Jws jws;
    jws.header = std::move(*header);
    jws.payload = std::move(*payload);
    jws.signing_input = std::string(compact.substr(0, second));
    jws.signature = std::move(*signature);
    jws.serialized = std::string(compact);

    if (jws.algorithm().empty()) {
        log().debug("JWS header has no alg");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    return jws;
}

bool Jws::verify(const SignatureVerifier& verifier) const {
    if (algorithm() != verifier.algorithm()) {
        log().warn("JWS alg {} does not match key algorithm {}", algorithm(), verifier.algorithm());
        return false;
    }
    return verifier.verify(as_bytes(signing_input), signature);
}

std::string Jws::algorithm() const {
    return json_string_field(header, "alg");
}

std::string Jws::type() const {
    return json_string_field(header, "typ");
}

} // namespace sdjwt
