#pragma once

#include "common/jws.hpp"
#include "sdjwt/claim_path.hpp"
#include "sdjwt/disclosure.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdjwt {

// ============================================================================
// Disclosure selection
// ============================================================================

struct DisclosureSelection {
    bool all = false;
    std::vector<ClaimPath> paths;

    static DisclosureSelection everything() { return {true, {}}; }
    static DisclosureSelection of(std::vector<ClaimPath> paths) { return {false, std::move(paths)}; }
};

// What to do with a selected path that has no disclosure behind it
enum class UnmatchedSelection {
    REJECT,  // UNKNOWN_CLAIM_SELECTED
    IGNORE,  // logged and skipped
};

struct HolderBindingRequest {
    std::string nonce;
    std::string audience;
    std::shared_ptr<const Signer> signer;
    std::optional<int64_t> issued_at;  // defaults to the current time
};

struct Presentation {
    std::string combined;                  // JWS~d1~...~dk~[kb-jwt]
    std::vector<std::string> disclosures;  // issuance order
    std::optional<Jws> binding_jwt;
};

// ============================================================================
// Holder
// ============================================================================
// Owns a parsed issuance artifact. The issuer signature is not checked here;
// the digest structure is, so every disclosure is known to sit at a place in
// the signed payload.

class Holder {
public:
    static std::expected<Holder, ErrorCode> parse(std::string_view combined_issuance);

    // Path of every disclosure, issuance order
    const std::vector<ClaimPath>& disclosable_paths() const { return paths_; }

    // True when the payload carries cnf
    bool requires_holder_binding() const;

    const Jws& jws() const { return jws_; }
    const json::object& payload() const { return jws_.payload; }
    const std::vector<Disclosure>& disclosures() const { return disclosures_; }

    // Selecting a path also reveals everything disclosable below it and the
    // disclosures of its ancestors
    std::expected<Presentation, ErrorCode> create_presentation(
        const DisclosureSelection& selection,
        UnmatchedSelection unmatched,
        const std::optional<HolderBindingRequest>& binding = std::nullopt) const;

private:
    Holder() = default;

    std::expected<std::vector<bool>, ErrorCode> select(
        const DisclosureSelection& selection, UnmatchedSelection unmatched) const;

    std::expected<std::optional<Jws>, ErrorCode> make_binding(
        const std::optional<HolderBindingRequest>& binding) const;

    Jws jws_;
    std::vector<Disclosure> disclosures_;
    std::vector<ClaimPath> paths_;                 // per disclosure
    std::vector<std::optional<size_t>> parents_;   // enclosing disclosure
};

} // namespace sdjwt
