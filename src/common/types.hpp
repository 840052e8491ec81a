#pragma once

#include "common/constants.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sdjwt {

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Error Codes
// ============================================================================
// One code per failure class. Verifier-side codes are terminal for the
// verification attempt; issuer/holder-side codes abort artifact construction.
enum class ErrorCode : uint16_t {
    // Artifact structure (1xxx)
    ENCODING_ERROR          = 1001,
    UNSUPPORTED_ALGORITHM   = 1002,

    // Cryptographic checks (2xxx)
    INVALID_SIGNATURE       = 2001,
    UNKNOWN_ISSUER          = 2002,
    SIGNING_ERROR           = 2003,

    // Digest bookkeeping (3xxx)
    UNRESOLVED_DIGEST       = 3001,
    DUPLICATE_DIGEST        = 3002,

    // Temporal claims (4xxx)
    EXPIRED_CREDENTIAL      = 4001,
    NOT_YET_VALID           = 4002,

    // Holder binding (5xxx)
    HOLDER_BINDING          = 5001,
    MISSING_BINDING         = 5002,
    MISSING_BINDING_KEY     = 5003,

    // Caller configuration (6xxx)
    POLICY_ERROR            = 6001,
    UNKNOWN_CLAIM_SELECTED  = 6002,
};

constexpr std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ENCODING_ERROR:         return "Malformed artifact";
        case ErrorCode::UNSUPPORTED_ALGORITHM:  return "Unsupported algorithm";
        case ErrorCode::INVALID_SIGNATURE:      return "Signature verification failed";
        case ErrorCode::UNKNOWN_ISSUER:         return "Issuer key could not be resolved";
        case ErrorCode::SIGNING_ERROR:          return "Signing failed";
        case ErrorCode::UNRESOLVED_DIGEST:      return "Disclosure does not match any digest";
        case ErrorCode::DUPLICATE_DIGEST:       return "Duplicate digest";
        case ErrorCode::EXPIRED_CREDENTIAL:     return "Credential expired";
        case ErrorCode::NOT_YET_VALID:          return "Credential not yet valid";
        case ErrorCode::HOLDER_BINDING:         return "Holder binding invalid";
        case ErrorCode::MISSING_BINDING:        return "Holder binding required but absent";
        case ErrorCode::MISSING_BINDING_KEY:    return "Holder binding key not supplied";
        case ErrorCode::POLICY_ERROR:           return "Invalid disclosure policy";
        case ErrorCode::UNKNOWN_CLAIM_SELECTED: return "Selected claim has no disclosure";
    }
    return "Unknown error";
}

// Taxonomy name, e.g. "UnresolvedDigestError"
std::string_view error_code_name(ErrorCode code);

} // namespace sdjwt
