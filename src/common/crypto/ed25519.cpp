#include "common/crypto/ed25519.hpp"
#include <sodium.h>
#include <cstring>

namespace sdjwt::crypto {

std::expected<std::pair<Ed25519PublicKey, Ed25519PrivateKey>, CryptoError>
Ed25519::generate_keypair() {
    if (!init()) {
        return std::unexpected(CryptoError::INIT_FAILED);
    }

    Ed25519PublicKey pub;
    Ed25519PrivateKey priv;

    if (crypto_sign_keypair(pub.data(), priv.data()) != 0) {
        return std::unexpected(CryptoError::KEY_GENERATION_FAILED);
    }

    return std::make_pair(pub, priv);
}

std::expected<std::pair<Ed25519PublicKey, Ed25519PrivateKey>, CryptoError>
Ed25519::keypair_from_seed(const Ed25519Seed& seed) {
    if (!init()) {
        return std::unexpected(CryptoError::INIT_FAILED);
    }

    Ed25519PublicKey pub;
    Ed25519PrivateKey priv;

    if (crypto_sign_seed_keypair(pub.data(), priv.data(), seed.data()) != 0) {
        return std::unexpected(CryptoError::KEY_GENERATION_FAILED);
    }

    return std::make_pair(pub, priv);
}

std::expected<Ed25519::Signature, CryptoError> Ed25519::sign(
    const Ed25519PrivateKey& private_key,
    std::span<const uint8_t> message) {

    Signature sig;

    if (crypto_sign_detached(
            sig.data(), nullptr,
            message.data(), message.size(),
            private_key.data()) != 0) {
        return std::unexpected(CryptoError::SIGN_FAILED);
    }

    return sig;
}

bool Ed25519::verify(
    const Ed25519PublicKey& public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {

    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    return crypto_sign_verify_detached(
        signature.data(),
        message.data(), message.size(),
        public_key.data()
    ) == 0;
}

Ed25519PublicKey Ed25519::public_key_from_private(const Ed25519PrivateKey& private_key) {
    Ed25519PublicKey pub;

    // Ed25519 secret key contains public key in last 32 bytes
    std::memcpy(pub.data(), private_key.data() + 32, 32);

    return pub;
}

} // namespace sdjwt::crypto
