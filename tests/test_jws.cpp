#include <gtest/gtest.h>
#include "common/encoding.hpp"
#include "common/jws.hpp"

using namespace sdjwt;

class JwsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto signer = Ed25519Signer::generate();
        ASSERT_TRUE(signer.has_value());
        signer_ = std::move(*signer);

        payload_["iss"] = "https://issuer.example.com";
        payload_["sub"] = "user_42";
    }

    std::unique_ptr<Ed25519Signer> signer_;
    json::object payload_;
};

TEST_F(JwsTest, SignAndVerify) {
    auto jws = Jws::sign(payload_, *signer_, "example+sd-jwt");
    ASSERT_TRUE(jws.has_value());

    EXPECT_EQ(jws->algorithm(), "EdDSA");
    EXPECT_EQ(jws->type(), "example+sd-jwt");
    EXPECT_TRUE(jws->verify(*signer_->verifier()));
}

TEST_F(JwsTest, ParseRoundtrip) {
    auto jws = Jws::sign(payload_, *signer_, "kb+jwt");
    ASSERT_TRUE(jws.has_value());

    auto parsed = Jws::parse(jws->serialized);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->payload, payload_);
    EXPECT_EQ(parsed->header, jws->header);
    EXPECT_EQ(parsed->signing_input, jws->signing_input);
    EXPECT_TRUE(parsed->verify(*signer_->verifier()));
}

TEST_F(JwsTest, ExtraHeaderCannotOverrideAlg) {
    json::object extra;
    extra["alg"] = "none";
    extra["kid"] = "issuer-key-1";

    auto jws = Jws::sign(payload_, *signer_, "example+sd-jwt", extra);
    ASSERT_TRUE(jws.has_value());
    EXPECT_EQ(jws->algorithm(), "EdDSA");
    EXPECT_EQ(jws->header.at("kid").as_string(), "issuer-key-1");
}

TEST_F(JwsTest, WrongKeyFails) {
    auto other = Ed25519Signer::generate();
    ASSERT_TRUE(other.has_value());

    auto jws = Jws::sign(payload_, *signer_, "example+sd-jwt");
    ASSERT_TRUE(jws.has_value());
    EXPECT_FALSE(jws->verify(*(*other)->verifier()));
}

TEST_F(JwsTest, TamperedPayloadFails) {
    auto jws = Jws::sign(payload_, *signer_, "example+sd-jwt");
    ASSERT_TRUE(jws.has_value());

    json::object forged = payload_;
    forged["sub"] = "admin";
    std::string header_b64 = jws->serialized.substr(0, jws->serialized.find('.'));
    std::string sig_b64 = jws->serialized.substr(jws->serialized.rfind('.') + 1);
    std::string tampered = header_b64 + "." + base64url_encode(json::serialize(forged)) + "." + sig_b64;

    auto parsed = Jws::parse(tampered);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->verify(*signer_->verifier()));
}

TEST_F(JwsTest, AlgorithmMismatchFails) {
    HmacSigner hmac(Bytes{1, 2, 3, 4});
    auto jws = Jws::sign(payload_, hmac, "example+sd-jwt");
    ASSERT_TRUE(jws.has_value());
    EXPECT_EQ(jws->algorithm(), "HS256");

    // An HS256 token never verifies against an EdDSA key
    EXPECT_FALSE(jws->verify(*signer_->verifier()));
}

TEST_F(JwsTest, Hs256SignAndVerify) {
    HmacSigner signer(Bytes{9, 8, 7, 6, 5});
    HmacVerifier verifier(Bytes{9, 8, 7, 6, 5});
    HmacVerifier wrong(Bytes{1});

    auto jws = Jws::sign(payload_, signer, "example+sd-jwt");
    ASSERT_TRUE(jws.has_value());
    EXPECT_TRUE(jws->verify(verifier));
    EXPECT_FALSE(jws->verify(wrong));
    EXPECT_FALSE(signer.public_jwk().has_value());
}

TEST_F(JwsTest, ParseRejectsMalformed) {
    EXPECT_EQ(Jws::parse("").error(), ErrorCode::ENCODING_ERROR);
    EXPECT_EQ(Jws::parse("a.b").error(), ErrorCode::ENCODING_ERROR);
    EXPECT_EQ(Jws::parse("a.b.c.d").error(), ErrorCode::ENCODING_ERROR);

    auto jws = Jws::sign(payload_, *signer_, "example+sd-jwt");
    ASSERT_TRUE(jws.has_value());
    std::string unsigned_form = jws->signing_input + ".";
    EXPECT_EQ(Jws::parse(unsigned_form).error(), ErrorCode::ENCODING_ERROR);

    // Header without alg
    std::string no_alg = base64url_encode(std::string_view(R"({"typ":"JWT"})")) + "." +
                         base64url_encode(std::string_view("{}")) + ".AAAA";
    EXPECT_EQ(Jws::parse(no_alg).error(), ErrorCode::ENCODING_ERROR);

    // Payload that is not an object
    std::string array_payload = base64url_encode(std::string_view(R"({"alg":"EdDSA"})")) + "." +
                                base64url_encode(std::string_view("[1,2]")) + ".AAAA";
    EXPECT_EQ(Jws::parse(array_payload).error(), ErrorCode::ENCODING_ERROR);
}

TEST_F(JwsTest, PublicJwkRoundtrip) {
    auto jwk = signer_->public_jwk();
    ASSERT_TRUE(jwk.has_value());
    EXPECT_EQ(jwk->at("kty").as_string(), "OKP");
    EXPECT_EQ(jwk->at("crv").as_string(), "Ed25519");

    auto verifier = verifier_from_jwk(*jwk);
    ASSERT_TRUE(verifier.has_value());

    auto jws = Jws::sign(payload_, *signer_, "kb+jwt");
    ASSERT_TRUE(jws.has_value());
    EXPECT_TRUE(jws->verify(**verifier));
}

TEST_F(JwsTest, VerifierFromJwkRejectsOtherKeys) {
    json::object oct;
    oct["kty"] = "oct";
    oct["k"] = "c2VjcmV0";
    EXPECT_EQ(verifier_from_jwk(oct).error(), ErrorCode::UNSUPPORTED_ALGORITHM);

    json::object bad_x;
    bad_x["kty"] = "OKP";
    bad_x["crv"] = "Ed25519";
    bad_x["x"] = "AAAA";
    EXPECT_EQ(verifier_from_jwk(bad_x).error(), ErrorCode::ENCODING_ERROR);
}

TEST_F(JwsTest, SeededSignerIsStable) {
    crypto::Ed25519Seed seed{};
    seed.fill(7);
    auto a = Ed25519Signer::from_seed(seed);
    auto b = Ed25519Signer::from_seed(seed);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*(*a)->public_jwk(), *(*b)->public_jwk());
}
