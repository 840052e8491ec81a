#include <gtest/gtest.h>
#include "common/crypto.hpp"
#include "common/crypto/ed25519.hpp"
#include "common/encoding.hpp"

using namespace sdjwt;
using namespace sdjwt::crypto;

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init());
    }
    void TearDown() override {}
};

// Ed25519 Tests
TEST_F(CryptoTest, Ed25519KeyGeneration) {
    auto kp1 = Ed25519::generate_keypair();
    auto kp2 = Ed25519::generate_keypair();
    ASSERT_TRUE(kp1.has_value());
    ASSERT_TRUE(kp2.has_value());

    // Keys should be the right size
    EXPECT_EQ(kp1->first.size(), 32u);
    EXPECT_EQ(kp1->second.size(), 64u);

    // Keys should be different
    EXPECT_NE(kp1->first, kp2->first);
    EXPECT_NE(kp1->second, kp2->second);
}

TEST_F(CryptoTest, Ed25519SeedIsDeterministic) {
    Ed25519Seed seed{};
    for (size_t i = 0; i < seed.size(); i++) seed[i] = static_cast<uint8_t>(i);

    auto kp1 = Ed25519::keypair_from_seed(seed);
    auto kp2 = Ed25519::keypair_from_seed(seed);
    ASSERT_TRUE(kp1.has_value());
    ASSERT_TRUE(kp2.has_value());

    EXPECT_EQ(kp1->first, kp2->first);
    EXPECT_EQ(kp1->second, kp2->second);
    EXPECT_EQ(Ed25519::public_key_from_private(kp1->second), kp1->first);
}

TEST_F(CryptoTest, Ed25519SignVerify) {
    auto kp = Ed25519::generate_keypair();
    ASSERT_TRUE(kp.has_value());

    std::vector<uint8_t> message = {0x01, 0x02, 0x03};
    auto signature = Ed25519::sign(kp->second, std::span<const uint8_t>(message));
    ASSERT_TRUE(signature.has_value());

    bool valid = Ed25519::verify(kp->first, std::span<const uint8_t>(message), *signature);
    EXPECT_TRUE(valid);
}

TEST_F(CryptoTest, Ed25519InvalidSignature) {
    auto kp = Ed25519::generate_keypair();
    ASSERT_TRUE(kp.has_value());

    std::vector<uint8_t> message = {0x01, 0x02, 0x03};
    auto signature = Ed25519::sign(kp->second, std::span<const uint8_t>(message));
    ASSERT_TRUE(signature.has_value());

    // Modify message
    std::vector<uint8_t> modified_message = {0x01, 0x02, 0x04};
    EXPECT_FALSE(Ed25519::verify(kp->first, std::span<const uint8_t>(modified_message), *signature));

    // Truncated signature
    std::span<const uint8_t> truncated(signature->data(), signature->size() - 1);
    EXPECT_FALSE(Ed25519::verify(kp->first, std::span<const uint8_t>(message), truncated));
}

// Digest Tests
TEST_F(CryptoTest, Sha256KnownVector) {
    auto hash = digest("sha-256", as_bytes("abc"));
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(base64url_encode(*hash), "ungWv48Bz-pBQUDeXa4iI7ADYaOWF3qctBD_YfIAFa0");
}

TEST_F(CryptoTest, DigestLengths) {
    EXPECT_EQ(digest("sha-256", as_bytes("x"))->size(), 32u);
    EXPECT_EQ(digest("sha-384", as_bytes("x"))->size(), 48u);
    EXPECT_EQ(digest("sha-512", as_bytes("x"))->size(), 64u);
    EXPECT_EQ(digest("sha3-256", as_bytes("x"))->size(), 32u);
}

TEST_F(CryptoTest, UnsupportedDigest) {
    EXPECT_FALSE(is_supported_digest("md5"));
    EXPECT_FALSE(is_supported_digest("SHA256"));
    auto hash = digest("md5", as_bytes("abc"));
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error(), CryptoError::UNSUPPORTED_DIGEST);
}

// HMAC-SHA256 Tests (RFC 4231 test case 2)
TEST_F(CryptoTest, HmacSha256KnownVector) {
    auto mac = hmac_sha256(as_bytes("Jefe"), as_bytes("what do ya want for nothing?"));
    ASSERT_TRUE(mac.has_value());

    const std::vector<uint8_t> expected = {
        0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24, 0x26,
        0x08, 0x95, 0x75, 0xc7, 0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83,
        0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43,
    };
    EXPECT_EQ(*mac, expected);
}

// Random Tests
TEST_F(CryptoTest, RandomBytes) {
    auto a = random_bytes(16);
    auto b = random_bytes(16);
    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);
}

TEST_F(CryptoTest, RandomUniformStaysInRange) {
    for (int i = 0; i < 200; ++i) {
        EXPECT_LT(random_uniform(4), 4u);
    }
}

TEST_F(CryptoTest, SecureCompare) {
    std::vector<uint8_t> a = {1, 2, 3};
    std::vector<uint8_t> b = {1, 2, 3};
    std::vector<uint8_t> c = {1, 2, 4};
    std::vector<uint8_t> d = {1, 2};
    EXPECT_TRUE(secure_compare(a, b));
    EXPECT_FALSE(secure_compare(a, c));
    EXPECT_FALSE(secure_compare(a, d));
}

TEST_F(CryptoTest, SecureWipe) {
    std::vector<uint8_t> secret = {0xde, 0xad, 0xbe, 0xef};
    secure_wipe(secret);
    EXPECT_EQ(secret, std::vector<uint8_t>(4, 0));
}

// Base64url Tests
TEST_F(CryptoTest, Base64UrlRoundtrip) {
    std::vector<uint8_t> data = {0xfb, 0xff, 0xfe, 0x00, 0x41};
    std::string encoded = base64url_encode(data);
    EXPECT_EQ(encoded.find('='), std::string::npos);
    EXPECT_EQ(encoded.find('+'), std::string::npos);
    EXPECT_EQ(encoded.find('/'), std::string::npos);

    auto decoded = base64url_decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST_F(CryptoTest, Base64UrlRejectsForeignAlphabet) {
    EXPECT_FALSE(base64url_decode("YWJj=").has_value());
    EXPECT_FALSE(base64url_decode("+/8").has_value());
    EXPECT_FALSE(base64url_decode("YW Jj").has_value());
    EXPECT_EQ(base64url_decode_string("YWJj").value_or(""), "abc");
}
