#include "sdjwt/issuer.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"
#include "sdjwt/combined.hpp"
#include <algorithm>
#include <charconv>

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.issuer"); }

std::optional<size_t> parse_array_index(const std::string& segment) {
    if (segment.empty() || (segment.size() > 1 && segment[0] == '0')) {
        return std::nullopt;
    }
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc() || ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

// Resolve a path against the plain claim tree
const json::value* find_claim(const json::value& root, const ClaimPath& path) {
    const json::value* current = &root;
    for (const auto& segment : path.segments()) {
        if (const auto* obj = current->if_object()) {
            auto it = obj->find(segment);
            if (it == obj->end()) return nullptr;
            current = &it->value();
        } else if (const auto* arr = current->if_array()) {
            auto index = parse_array_index(segment);
            if (!index || *index >= arr->size()) return nullptr;
            current = &(*arr)[*index];
        } else {
            return nullptr;
        }
    }
    return current;
}

json::object array_digest_entry(const std::string& digest) {
    json::object entry;
    entry[format::ARRAY_DIGEST_KEY] = digest;
    return entry;
}

// Per-issuance state: the digest bookkeeping of one artifact
class SdClaimBuilder {
public:
    SdClaimBuilder(const IssuerOptions& options, std::vector<Disclosure>& disclosures,
                   std::vector<std::string>& decoys)
        : options_(options), disclosures_(disclosures), decoys_(decoys) {}

    std::expected<json::value, ErrorCode> process(const json::value& value, const ClaimPath& path) {
        if (const auto* obj = value.if_object()) {
            auto result = process_object(*obj, path);
            if (!result) return std::unexpected(result.error());
            return json::value(std::move(*result));
        }
        if (const auto* arr = value.if_array()) {
            auto result = process_array(*arr, path);
            if (!result) return std::unexpected(result.error());
            return json::value(std::move(*result));
        }
        return value;
    }

    std::expected<json::object, ErrorCode> process_object(const json::object& obj, const ClaimPath& path) {
        json::object out;
        std::vector<std::string> digests;

        for (const auto& kv : obj) {
            std::string key(kv.key());
            ClaimPath child = path.child(key);

            // A plain "_sd" or "..." would be read back as digest structure
            if (is_reserved_claim_name(key)) {
                log().error("Input claims use reserved name at {}", child.to_string());
                return std::unexpected(ErrorCode::POLICY_ERROR);
            }

            // Inner claims first, so nested disclosures precede their parent
            auto processed = process(kv.value(), child);
            if (!processed) return std::unexpected(processed.error());

            if (is_selected(child)) {
                auto disclosure = make_disclosure(generate_salt(), key, std::move(*processed),
                                                  options_.digest_algorithm);
                if (!disclosure) return std::unexpected(disclosure.error());
                log().trace("Claim {} made selectively disclosable", child.to_string());
                digests.push_back(disclosure->digest);
                disclosures_.push_back(std::move(*disclosure));
            } else {
                out[key] = std::move(*processed);
            }
        }

        size_t decoy_count = options_.decoy_policy->object_decoys(path, digests.size());
        for (size_t i = 0; i < decoy_count; ++i) {
            auto decoy = make_decoy_digest(options_.digest_algorithm);
            if (!decoy) return std::unexpected(decoy.error());
            digests.push_back(*decoy);
            decoys_.push_back(std::move(*decoy));
        }

        if (!digests.empty()) {
            // Sorting hides which digests are decoys and the original claim order
            std::sort(digests.begin(), digests.end());
            json::array sd;
            for (auto& d : digests) sd.emplace_back(d);
            out[format::SD_DIGESTS_KEY] = std::move(sd);
        }

        return out;
    }

    std::expected<json::array, ErrorCode> process_array(const json::array& arr, const ClaimPath& path) {
        json::array out;
        size_t real = 0;

        for (size_t i = 0; i < arr.size(); ++i) {
            ClaimPath child = path.child(i);

            auto processed = process(arr[i], child);
            if (!processed) return std::unexpected(processed.error());

            if (is_selected(child)) {
                auto disclosure = make_disclosure(generate_salt(), std::nullopt, std::move(*processed),
                                                  options_.digest_algorithm);
                if (!disclosure) return std::unexpected(disclosure.error());
                out.emplace_back(array_digest_entry(disclosure->digest));
                disclosures_.push_back(std::move(*disclosure));
                ++real;
            } else {
                out.push_back(std::move(*processed));
            }
        }

        size_t decoy_count = options_.decoy_policy->array_decoys(path, real);
        for (size_t i = 0; i < decoy_count; ++i) {
            auto decoy = make_decoy_digest(options_.digest_algorithm);
            if (!decoy) return std::unexpected(decoy.error());
            auto pos = crypto::random_uniform(static_cast<uint32_t>(out.size() + 1));
            out.insert(out.begin() + pos, json::value(array_digest_entry(*decoy)));
            decoys_.push_back(std::move(*decoy));
        }

        return out;
    }

private:
    bool is_selected(const ClaimPath& path) const {
        const auto& policy = options_.disclosure_policy;
        bool top_level_registered = path.depth() == 1 && is_registered_claim(path.segments().front());

        switch (policy.mode) {
            case DisclosureMode::EXPLICIT:
                return std::find(policy.paths.begin(), policy.paths.end(), path) != policy.paths.end();
            case DisclosureMode::TOP_LEVEL:
                return path.depth() == 1 && !top_level_registered;
            case DisclosureMode::RECURSIVE:
                return path.depth() >= 1 && !top_level_registered;
        }
        return false;
    }

    const IssuerOptions& options_;
    std::vector<Disclosure>& disclosures_;
    std::vector<std::string>& decoys_;
};

} // anonymous namespace

bool is_registered_claim(std::string_view name) {
    return name == "iss" || name == "iat" || name == "exp" || name == "nbf" ||
           name == format::CNF_KEY;
}

Issuer::Issuer(IssuerOptions options) : options_(std::move(options)) {
    if (!options_.decoy_policy) {
        options_.decoy_policy = std::make_shared<NoDecoys>();
    }
}

std::expected<void, ErrorCode> Issuer::validate(const json::object& claims) const {
    if (!crypto::is_supported_digest(options_.digest_algorithm)) {
        log().error("Unsupported digest algorithm {}", options_.digest_algorithm);
        return std::unexpected(ErrorCode::UNSUPPORTED_ALGORITHM);
    }

    const auto& policy = options_.disclosure_policy;
    if (policy.mode != DisclosureMode::EXPLICIT) {
        return {};
    }

    json::value root(claims);
    for (const auto& path : policy.paths) {
        if (path.empty()) {
            log().error("Disclosure policy selects the root object");
            return std::unexpected(ErrorCode::POLICY_ERROR);
        }
        if (path.depth() == 1 && is_registered_claim(path.segments().front())) {
            log().error("Disclosure policy selects registered claim {}", path.to_string());
            return std::unexpected(ErrorCode::POLICY_ERROR);
        }
        for (const auto& segment : path.segments()) {
            if (is_reserved_claim_name(segment)) {
                log().error("Disclosure policy path {} uses a reserved name", path.to_string());
                return std::unexpected(ErrorCode::POLICY_ERROR);
            }
        }
        if (!find_claim(root, path)) {
            log().error("Disclosure policy path {} does not exist in the claims", path.to_string());
            return std::unexpected(ErrorCode::POLICY_ERROR);
        }
    }

    return {};
}

std::expected<IssuedSdJwt, ErrorCode> Issuer::issue(
    const json::object& claims,
    const Signer& signer,
    const std::optional<json::object>& holder_jwk) const {

    if (auto valid = validate(claims); !valid) {
        return std::unexpected(valid.error());
    }

    if (holder_jwk) {
        if (claims.contains(format::CNF_KEY)) {
            log().error("Claims already carry cnf while holder binding was requested");
            return std::unexpected(ErrorCode::POLICY_ERROR);
        }
        if (!verifier_from_jwk(*holder_jwk)) {
            log().error("Holder key is not a supported public JWK");
            return std::unexpected(ErrorCode::POLICY_ERROR);
        }
    }

    IssuedSdJwt issued;
    SdClaimBuilder builder(options_, issued.disclosures, issued.decoy_digests);

    auto payload = builder.process_object(claims, ClaimPath{});
    if (!payload) {
        return std::unexpected(payload.error());
    }

    issued.payload = std::move(*payload);
    issued.payload[format::SD_ALG_KEY] = options_.digest_algorithm;
    if (holder_jwk) {
        json::object cnf;
        cnf[format::JWK_KEY] = *holder_jwk;
        issued.payload[format::CNF_KEY] = std::move(cnf);
    }

    auto jws = Jws::sign(issued.payload, signer, options_.typ, options_.extra_header);
    if (!jws) {
        log().error("Signing the SD-JWT failed");
        return std::unexpected(ErrorCode::SIGNING_ERROR);
    }
    issued.jws = std::move(*jws);

    std::vector<std::string> encoded;
    encoded.reserve(issued.disclosures.size());
    for (const auto& d : issued.disclosures) {
        encoded.push_back(d.encoded);
    }
    issued.combined = join_combined(issued.jws.serialized, encoded);

    log().debug("Issued SD-JWT: alg={} disclosures={} decoys={} holder_binding={}",
                signer.algorithm(), issued.disclosures.size(), issued.decoy_digests.size(),
                holder_jwk.has_value());

    return issued;
}

} // namespace sdjwt
