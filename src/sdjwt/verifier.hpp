#pragma once

#include "common/constants.hpp"
#include "common/jws.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sdjwt {

// Maps the "iss" claim to the issuer's verification key. Must fail (error or
// null) for an issuer it does not know.
using IssuerKeyResolver = std::function<
    std::expected<std::shared_ptr<const SignatureVerifier>, ErrorCode>(std::string_view issuer)>;

struct VerifierOptions {
    // Setting either one makes holder binding mandatory
    std::optional<std::string> expected_audience;
    std::optional<std::string> expected_nonce;
    bool require_holder_binding = false;

    std::chrono::seconds clock_skew{defaults::CLOCK_SKEW};
    std::chrono::seconds max_binding_age{defaults::MAX_BINDING_AGE};

    // Unix time to check against; the system clock when unset
    std::optional<int64_t> now;
};

struct VerifiedClaims {
    json::object claims;                         // without _sd / _sd_alg
    bool holder_bound = false;
    std::optional<json::object> binding_payload;
};

// ============================================================================
// Verifier
// ============================================================================
// Every failure is terminal: either the whole claim set is verified or a
// single error code comes back.

class Verifier {
public:
    explicit Verifier(VerifierOptions options = {});

    std::expected<VerifiedClaims, ErrorCode> verify(
        std::string_view combined_presentation,
        const IssuerKeyResolver& resolve_issuer_key) const;

    const VerifierOptions& options() const { return options_; }

private:
    int64_t now() const;

    std::expected<void, ErrorCode> check_temporal(const json::object& payload) const;

    std::expected<json::object, ErrorCode> check_binding(
        const json::object& payload, std::string_view binding_jwt) const;

    bool binding_required() const;

    VerifierOptions options_;
};

} // namespace sdjwt
