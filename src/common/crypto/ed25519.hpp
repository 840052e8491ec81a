#pragma once

#include "common/constants.hpp"
#include "common/crypto.hpp"
#include <array>
#include <expected>
#include <span>
#include <string>
#include <utility>

namespace sdjwt::crypto {

using Ed25519PublicKey = std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using Ed25519PrivateKey = std::array<uint8_t, ED25519_PRIVATE_KEY_SIZE>;
using Ed25519Seed = std::array<uint8_t, ED25519_SEED_SIZE>;

// ============================================================================
// Ed25519 Digital Signatures
// ============================================================================
// Backs the "EdDSA" JWS algorithm for both issuer and holder keys.

class Ed25519 {
public:
    using Signature = std::array<uint8_t, ED25519_SIGNATURE_SIZE>;

    // Generate a new key pair
    static std::expected<std::pair<Ed25519PublicKey, Ed25519PrivateKey>, CryptoError>
        generate_keypair();

    // Deterministic key pair (fixtures and reproducible test vectors)
    static std::expected<std::pair<Ed25519PublicKey, Ed25519PrivateKey>, CryptoError>
        keypair_from_seed(const Ed25519Seed& seed);

    // Sign a message
    static std::expected<Signature, CryptoError> sign(
        const Ed25519PrivateKey& private_key,
        std::span<const uint8_t> message
    );

    // Verify a signature
    static bool verify(
        const Ed25519PublicKey& public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature
    );

    // Extract public key from private key
    static Ed25519PublicKey public_key_from_private(const Ed25519PrivateKey& private_key);
};

} // namespace sdjwt::crypto
