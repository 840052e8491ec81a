#include "sdjwt/holder.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"
#include "sdjwt/combined.hpp"
#include "sdjwt/digest_index.hpp"
#include "sdjwt/unpacker.hpp"
#include <algorithm>
#include <chrono>

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.holder"); }

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
} // anonymous namespace

std::expected<Holder, ErrorCode> Holder::parse(std::string_view combined_issuance) {
    auto parts = split_combined(combined_issuance);
    if (!parts) {
        return std::unexpected(parts.error());
    }
    if (parts->binding_jwt) {
        log().warn("Issuance artifact already carries a holder binding JWT");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    auto jws = Jws::parse(parts->jws);
    if (!jws) {
        log().warn("Issuance artifact holds a malformed JWS");
        return std::unexpected(jws.error());
    }

    auto alg = payload_digest_algorithm(jws->payload);
    if (!alg) {
        return std::unexpected(alg.error());
    }

    Holder holder;
    holder.jws_ = std::move(*jws);
    holder.disclosures_.reserve(parts->disclosures.size());
    for (const auto& encoded : parts->disclosures) {
        auto disclosure = parse_disclosure(encoded, *alg);
        if (!disclosure) {
            return std::unexpected(disclosure.error());
        }
        holder.disclosures_.push_back(std::move(*disclosure));
    }

    auto index = build_index(holder.disclosures_);
    if (!index) {
        return std::unexpected(index.error());
    }

    // Locate every disclosure by walking the payload once
    const Disclosure* base = holder.disclosures_.data();
    holder.paths_.resize(holder.disclosures_.size());
    holder.parents_.resize(holder.disclosures_.size());

    ClaimUnpacker unpacker(*index, [&](const UnpackVisit& visit) {
        auto i = static_cast<size_t>(visit.disclosure - base);
        holder.paths_[i] = visit.path;
        if (visit.parent) {
            holder.parents_[i] = static_cast<size_t>(visit.parent - base);
        }
    });

    auto claims = unpacker.unpack(holder.jws_.payload);
    if (!claims) {
        return std::unexpected(claims.error());
    }

    if (auto unused = index->unused(); !unused.empty()) {
        log().warn("{} disclosure(s) are not referenced by the payload", unused.size());
        return std::unexpected(ErrorCode::UNRESOLVED_DIGEST);
    }

    log().debug("Parsed issuance: disclosures={} holder_binding={}",
                holder.disclosures_.size(), holder.requires_holder_binding());
    return holder;
}

bool Holder::requires_holder_binding() const {
    return jws_.payload.contains(format::CNF_KEY);
}

std::expected<std::vector<bool>, ErrorCode> Holder::select(
    const DisclosureSelection& selection, UnmatchedSelection unmatched) const {

    std::vector<bool> selected(disclosures_.size(), selection.all);
    if (selection.all) {
        return selected;
    }

    for (const auto& path : selection.paths) {
        auto it = std::find(paths_.begin(), paths_.end(), path);
        if (it == paths_.end()) {
            if (unmatched == UnmatchedSelection::REJECT) {
                log().error("Selected claim {} has no disclosure", path.to_string());
                return std::unexpected(ErrorCode::UNKNOWN_CLAIM_SELECTED);
            }
            log().warn("Selected claim {} has no disclosure, skipped", path.to_string());
            continue;
        }

        // The subtree below the selected claim
        for (size_t i = 0; i < paths_.size(); ++i) {
            if (paths_[i].starts_with(path)) selected[i] = true;
        }

        // Ancestors needed to reach it
        std::optional<size_t> current = static_cast<size_t>(it - paths_.begin());
        while (current) {
            selected[*current] = true;
            current = parents_[*current];
        }
    }

    return selected;
}

std::expected<std::optional<Jws>, ErrorCode> Holder::make_binding(
    const std::optional<HolderBindingRequest>& binding) const {

    if (!requires_holder_binding()) {
        if (binding) {
            log().error("Holder binding requested for a credential without cnf");
            return std::unexpected(ErrorCode::POLICY_ERROR);
        }
        return std::optional<Jws>{};
    }

    if (!binding || !binding->signer) {
        log().error("Credential requires holder binding but no holder key was supplied");
        return std::unexpected(ErrorCode::MISSING_BINDING_KEY);
    }

    const json::object* expected_jwk = confirmation_key(jws_.payload);
    auto holder_jwk = binding->signer->public_jwk();
    if (!expected_jwk || !holder_jwk || *holder_jwk != *expected_jwk) {
        log().error("Holder key does not match the key bound in cnf");
        return std::unexpected(ErrorCode::HOLDER_BINDING);
    }

    json::object payload;
    payload["nonce"] = binding->nonce;
    payload["aud"] = binding->audience;
    payload["iat"] = binding->issued_at.value_or(unix_now());

    auto jwt = Jws::sign(payload, *binding->signer, format::BINDING_JWT_TYP);
    if (!jwt) {
        log().error("Signing the holder binding JWT failed");
        return std::unexpected(ErrorCode::SIGNING_ERROR);
    }
    return std::optional<Jws>(std::move(*jwt));
}

std::expected<Presentation, ErrorCode> Holder::create_presentation(
    const DisclosureSelection& selection,
    UnmatchedSelection unmatched,
    const std::optional<HolderBindingRequest>& binding) const {

    auto selected = select(selection, unmatched);
    if (!selected) {
        return std::unexpected(selected.error());
    }

    auto binding_jwt = make_binding(binding);
    if (!binding_jwt) {
        return std::unexpected(binding_jwt.error());
    }

    Presentation presentation;
    for (size_t i = 0; i < disclosures_.size(); ++i) {
        if ((*selected)[i]) {
            presentation.disclosures.push_back(disclosures_[i].encoded);
        }
    }
    presentation.binding_jwt = std::move(*binding_jwt);

    std::optional<std::string> binding_serialized;
    if (presentation.binding_jwt) {
        binding_serialized = presentation.binding_jwt->serialized;
    }
    presentation.combined = join_combined(jws_.serialized, presentation.disclosures, binding_serialized);

    log().debug("Presentation: disclosed {}/{} holder_binding={}",
                presentation.disclosures.size(), disclosures_.size(),
                presentation.binding_jwt.has_value());
    return presentation;
}

} // namespace sdjwt
