#include "sdjwt/verifier.hpp"
#include "common/logger.hpp"
#include "sdjwt/combined.hpp"
#include "sdjwt/digest_index.hpp"
#include "sdjwt/disclosure.hpp"
#include "sdjwt/unpacker.hpp"
#include <exception>

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.verifier"); }

// Absent claims yield nullopt; present but non-numeric is ENCODING_ERROR
std::expected<std::optional<double>, ErrorCode> numeric_claim(
    const json::object& obj, std::string_view name) {
    auto it = obj.find(name);
    if (it == obj.end()) {
        return std::optional<double>{};
    }
    json::error_code ec;
    double value = it->value().to_number<double>(ec);
    if (ec) {
        log().warn("Claim {} is not a number", name);
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }
    return std::optional<double>(value);
}

std::optional<std::string> string_claim(const json::object& obj, std::string_view name) {
    auto it = obj.find(name);
    if (it == obj.end() || !it->value().is_string()) {
        return std::nullopt;
    }
    const auto& s = it->value().get_string();
    return std::string(s.data(), s.size());
}
} // anonymous namespace

Verifier::Verifier(VerifierOptions options) : options_(std::move(options)) {}

int64_t Verifier::now() const {
    if (options_.now) return *options_.now;
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool Verifier::binding_required() const {
    return options_.require_holder_binding ||
           options_.expected_nonce.has_value() ||
           options_.expected_audience.has_value();
}

std::expected<void, ErrorCode> Verifier::check_temporal(const json::object& payload) const {
    const double current = static_cast<double>(now());
    const double skew = static_cast<double>(options_.clock_skew.count());

    auto exp = numeric_claim(payload, "exp");
    if (!exp) return std::unexpected(exp.error());
    if (*exp && current >= **exp + skew) {
        log().info("Credential expired at {}", **exp);
        return std::unexpected(ErrorCode::EXPIRED_CREDENTIAL);
    }

    for (std::string_view name : {"nbf", "iat"}) {
        auto claim = numeric_claim(payload, name);
        if (!claim) return std::unexpected(claim.error());
        if (*claim && **claim > current + skew) {
            log().info("Credential {} {} lies in the future", name, **claim);
            return std::unexpected(ErrorCode::NOT_YET_VALID);
        }
    }

    return {};
}

std::expected<json::object, ErrorCode> Verifier::check_binding(
    const json::object& payload, std::string_view binding_jwt) const {

    const json::object* jwk = confirmation_key(payload);
    if (!jwk) {
        log().warn("Holder binding JWT present but the credential binds no key");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }

    auto holder_key = verifier_from_jwk(*jwk);
    if (!holder_key) {
        log().warn("Credential cnf.jwk is not a usable key");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }

    auto jwt = Jws::parse(binding_jwt);
    if (!jwt) {
        log().warn("Holder binding JWT is malformed");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }
    if (jwt->type() != format::BINDING_JWT_TYP) {
        log().warn("Holder binding JWT has typ {}", jwt->type());
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }
    if (!jwt->verify(**holder_key)) {
        log().warn("Holder binding JWT signature does not verify");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }

    if (!options_.expected_nonce || !options_.expected_audience) {
        log().warn("Holder binding JWT present but no expected nonce and audience are configured");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }
    if (string_claim(jwt->payload, "nonce") != options_.expected_nonce) {
        log().warn("Holder binding nonce mismatch");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }
    if (string_claim(jwt->payload, "aud") != options_.expected_audience) {
        log().warn("Holder binding audience mismatch");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }

    auto iat = numeric_claim(jwt->payload, "iat");
    if (!iat || !*iat) {
        log().warn("Holder binding JWT has no numeric iat");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }
    const double current = static_cast<double>(now());
    const double skew = static_cast<double>(options_.clock_skew.count());
    const double max_age = static_cast<double>(options_.max_binding_age.count());
    if (**iat > current + skew || current - **iat > max_age + skew) {
        log().warn("Holder binding JWT iat {} is outside the accepted window", **iat);
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }

    return std::move(jwt->payload);
}

std::expected<VerifiedClaims, ErrorCode> Verifier::verify(
    std::string_view combined_presentation,
    const IssuerKeyResolver& resolve_issuer_key) const {

    auto parts = split_combined(combined_presentation);
    if (!parts) {
        return std::unexpected(parts.error());
    }

    auto jws = Jws::parse(parts->jws);
    if (!jws) {
        log().warn("Presentation holds a malformed JWS");
        return std::unexpected(jws.error());
    }

    // Issuer key, then the signature over everything the payload commits to
    auto issuer = string_claim(jws->payload, "iss");
    if (!issuer) {
        log().warn("Credential has no string iss claim");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    std::shared_ptr<const SignatureVerifier> issuer_key;
    try {
        auto resolved = resolve_issuer_key(*issuer);
        if (resolved) {
            issuer_key = std::move(*resolved);
        }
    } catch (const std::exception& e) {
        log().warn("Issuer key resolver for {} threw: {}", *issuer, e.what());
    }
    if (!issuer_key) {
        log().warn("No key for issuer {}", *issuer);
        return std::unexpected(ErrorCode::UNKNOWN_ISSUER);
    }

    if (!jws->verify(*issuer_key)) {
        log().warn("Issuer signature of {} does not verify", *issuer);
        return std::unexpected(ErrorCode::INVALID_SIGNATURE);
    }

    if (auto temporal = check_temporal(jws->payload); !temporal) {
        return std::unexpected(temporal.error());
    }

    auto alg = payload_digest_algorithm(jws->payload);
    if (!alg) {
        return std::unexpected(alg.error());
    }

    // Digest bookkeeping
    std::vector<Disclosure> disclosures;
    disclosures.reserve(parts->disclosures.size());
    for (const auto& encoded : parts->disclosures) {
        auto disclosure = parse_disclosure(encoded, *alg);
        if (!disclosure) {
            return std::unexpected(disclosure.error());
        }
        disclosures.push_back(std::move(*disclosure));
    }

    auto index = build_index(disclosures);
    if (!index) {
        return std::unexpected(index.error());
    }

    ClaimUnpacker unpacker(*index);
    auto claims = unpacker.unpack(jws->payload);
    if (!claims) {
        return std::unexpected(claims.error());
    }

    if (auto unused = index->unused(); !unused.empty()) {
        log().warn("{} disclosure(s) match no digest in the signed payload, first {}...",
                   unused.size(), unused.front().substr(0, 8));
        return std::unexpected(ErrorCode::UNRESOLVED_DIGEST);
    }

    VerifiedClaims result;
    result.claims = std::move(*claims);

    if (parts->binding_jwt) {
        auto binding = check_binding(jws->payload, *parts->binding_jwt);
        if (!binding) {
            return std::unexpected(binding.error());
        }
        result.holder_bound = true;
        result.binding_payload = std::move(*binding);
    } else if (binding_required()) {
        log().warn("Holder binding required but the presentation carries none");
        return std::unexpected(ErrorCode::MISSING_BINDING);
    }

    log().debug("Verified credential from {}: claims={} disclosures={} holder_bound={}",
                *issuer, result.claims.size(), disclosures.size(), result.holder_bound);
    return result;
}

} // namespace sdjwt
