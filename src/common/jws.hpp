#pragma once

#include "common/crypto/ed25519.hpp"
#include "common/types.hpp"
#include <boost/json.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sdjwt {

namespace json = boost::json;

// ============================================================================
// Signing seams
// ============================================================================
// The engines only see these interfaces; key storage and generation live
// with the caller.

class Signer {
public:
    virtual ~Signer() = default;

    // JWS "alg" value
    virtual std::string_view algorithm() const = 0;

    virtual std::expected<Bytes, ErrorCode> sign(std::span<const uint8_t> data) const = 0;

    // Public key as a JWK, absent for symmetric keys
    virtual std::optional<json::object> public_jwk() const = 0;
};

class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    virtual std::string_view algorithm() const = 0;

    virtual bool verify(std::span<const uint8_t> data,
                        std::span<const uint8_t> signature) const = 0;
};

// ============================================================================
// EdDSA (Ed25519, libsodium)
// ============================================================================

class Ed25519Verifier : public SignatureVerifier {
public:
    explicit Ed25519Verifier(const crypto::Ed25519PublicKey& public_key);

    std::string_view algorithm() const override { return "EdDSA"; }
    bool verify(std::span<const uint8_t> data,
                std::span<const uint8_t> signature) const override;

    // {"kty": "OKP", "crv": "Ed25519", "x": ...}
    json::object jwk() const;
    const crypto::Ed25519PublicKey& public_key() const { return public_key_; }

private:
    crypto::Ed25519PublicKey public_key_;
};

class Ed25519Signer : public Signer {
public:
    explicit Ed25519Signer(const crypto::Ed25519PrivateKey& private_key);
    ~Ed25519Signer() override;

    Ed25519Signer(const Ed25519Signer&) = delete;
    Ed25519Signer& operator=(const Ed25519Signer&) = delete;

    static std::expected<std::unique_ptr<Ed25519Signer>, ErrorCode> generate();
    static std::expected<std::unique_ptr<Ed25519Signer>, ErrorCode> from_seed(
        const crypto::Ed25519Seed& seed);

    std::string_view algorithm() const override { return "EdDSA"; }
    std::expected<Bytes, ErrorCode> sign(std::span<const uint8_t> data) const override;
    std::optional<json::object> public_jwk() const override;

    // Verifier for the matching public key
    std::shared_ptr<Ed25519Verifier> verifier() const;

private:
    crypto::Ed25519PrivateKey private_key_;
};

// ============================================================================
// HS256 (HMAC-SHA256, OpenSSL)
// ============================================================================
// Symmetric: usable for the issuer signature between parties sharing a
// secret, never for holder binding (the key cannot be published in cnf).

class HmacSigner : public Signer {
public:
    explicit HmacSigner(Bytes secret);
    ~HmacSigner() override;

    std::string_view algorithm() const override { return "HS256"; }
    std::expected<Bytes, ErrorCode> sign(std::span<const uint8_t> data) const override;
    std::optional<json::object> public_jwk() const override { return std::nullopt; }

private:
    Bytes secret_;
};

class HmacVerifier : public SignatureVerifier {
public:
    explicit HmacVerifier(Bytes secret);
    ~HmacVerifier() override;

    std::string_view algorithm() const override { return "HS256"; }
    bool verify(std::span<const uint8_t> data,
                std::span<const uint8_t> signature) const override;

private:
    Bytes secret_;
};

// Build a verifier from a public JWK (only OKP/Ed25519 is accepted)
std::expected<std::shared_ptr<const SignatureVerifier>, ErrorCode> verifier_from_jwk(
    const json::object& jwk);

// ============================================================================
// Compact JWS
// ============================================================================
// b64url(header) "." b64url(payload) "." b64url(signature)

struct Jws {
    json::object header;
    json::object payload;
    std::string signing_input;
    Bytes signature;
    std::string serialized;

    // Sign payload; header gets "alg" from the signer plus "typ"
    static std::expected<Jws, ErrorCode> sign(
        const json::object& payload,
        const Signer& signer,
        std::string_view typ,
        const json::object& extra_header = {});

    // Structural parse only, the signature is not checked
    static std::expected<Jws, ErrorCode> parse(std::string_view compact);

    // Header "alg" must equal the verifier's algorithm and the signature must verify
    bool verify(const SignatureVerifier& verifier) const;

    std::string algorithm() const;
    std::string type() const;
};

// Parse a JSON object from text; nullopt on malformed input or non-object
std::optional<json::object> parse_json_object(std::string_view text);

} // namespace sdjwt
