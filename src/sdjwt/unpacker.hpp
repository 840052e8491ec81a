#pragma once

#include "common/jws.hpp"
#include "sdjwt/claim_path.hpp"
#include "sdjwt/digest_index.hpp"
#include <expected>
#include <functional>

namespace sdjwt {

// ============================================================================
// ClaimUnpacker
// ============================================================================
// Walks an SD-JWT payload and replaces every digest found in the index with
// the disclosed claim:
//   - "_sd" digests of an object become members named by the disclosure
//   - {"...": digest} array elements become the disclosed value in place
// Digests absent from the index (withheld or decoy) are dropped. Each
// disclosure may be consumed once; a second reference is DUPLICATE_DIGEST.

struct UnpackVisit {
    const Disclosure* disclosure = nullptr;
    ClaimPath path;                          // position in the reconstructed tree
    const Disclosure* parent = nullptr;      // nearest enclosing disclosure
};

class ClaimUnpacker {
public:
    using VisitFn = std::function<void(const UnpackVisit&)>;

    explicit ClaimUnpacker(DigestIndex& index, VisitFn on_disclosure = {});

    // Reconstruct the payload; "_sd" and the top-level "_sd_alg" are removed
    std::expected<json::object, ErrorCode> unpack(const json::object& payload);

private:
    std::expected<json::value, ErrorCode> unpack_value(
        const json::value& value, const ClaimPath& path, const Disclosure* parent);
    std::expected<json::object, ErrorCode> unpack_object(
        const json::object& obj, const ClaimPath& path, const Disclosure* parent);
    std::expected<json::array, ErrorCode> unpack_array(
        const json::array& arr, const ClaimPath& path, const Disclosure* parent);

    // Looks up a digest and claims it; nullptr if unknown
    std::expected<const Disclosure*, ErrorCode> consume(std::string_view digest);

    DigestIndex& index_;
    VisitFn on_disclosure_;
};

// "_sd_alg" of a payload, sha-256 when absent. ENCODING_ERROR if it is not
// a string, UNSUPPORTED_ALGORITHM if no digest backend knows it.
std::expected<std::string, ErrorCode> payload_digest_algorithm(const json::object& payload);

// cnf.jwk of a payload, nullptr when there is none
const json::object* confirmation_key(const json::object& payload);

} // namespace sdjwt
