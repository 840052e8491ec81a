#pragma once

#include "common/constants.hpp"
#include "common/jws.hpp"
#include "sdjwt/claim_path.hpp"
#include "sdjwt/decoy_policy.hpp"
#include "sdjwt/disclosure.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sdjwt {

// ============================================================================
// Disclosure policy
// ============================================================================
// Which claims become selectively disclosable. Registered claims (iss, iat,
// exp, nbf, cnf) are always kept in the clear.

enum class DisclosureMode {
    EXPLICIT,    // exactly the listed paths
    TOP_LEVEL,   // every top-level claim
    RECURSIVE,   // every claim at every depth, array elements included
};

struct DisclosurePolicy {
    DisclosureMode mode = DisclosureMode::TOP_LEVEL;
    std::vector<ClaimPath> paths;

    static DisclosurePolicy top_level() { return {DisclosureMode::TOP_LEVEL, {}}; }
    static DisclosurePolicy recursive() { return {DisclosureMode::RECURSIVE, {}}; }
    static DisclosurePolicy explicit_paths(std::vector<ClaimPath> paths) {
        return {DisclosureMode::EXPLICIT, std::move(paths)};
    }
};

bool is_registered_claim(std::string_view name);

struct IssuerOptions {
    std::string digest_algorithm{format::DEFAULT_DIGEST_ALG};
    DisclosurePolicy disclosure_policy;
    std::shared_ptr<const DecoyPolicy> decoy_policy = std::make_shared<NoDecoys>();
    std::string typ{format::SD_JWT_TYP};
    json::object extra_header;
};

// ============================================================================
// Issuance result
// ============================================================================

struct IssuedSdJwt {
    json::object payload;
    Jws jws;
    std::vector<Disclosure> disclosures;     // generation order
    std::vector<std::string> decoy_digests;
    std::string combined;                    // JWS~d1~...~dn~

    const std::string& serialized_jws() const { return jws.serialized; }
};

// ============================================================================
// Issuer
// ============================================================================

class Issuer {
public:
    explicit Issuer(IssuerOptions options);

    // holder_jwk enables holder binding: it is embedded as cnf.jwk
    std::expected<IssuedSdJwt, ErrorCode> issue(
        const json::object& claims,
        const Signer& signer,
        const std::optional<json::object>& holder_jwk = std::nullopt) const;

    const IssuerOptions& options() const { return options_; }

private:
    std::expected<void, ErrorCode> validate(const json::object& claims) const;

    IssuerOptions options_;
};

} // namespace sdjwt
