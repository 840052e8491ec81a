#include "common/types.hpp"

namespace sdjwt {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ENCODING_ERROR:         return "EncodingError";
        case ErrorCode::UNSUPPORTED_ALGORITHM:  return "UnsupportedAlgorithmError";
        case ErrorCode::INVALID_SIGNATURE:      return "InvalidSignatureError";
        case ErrorCode::UNKNOWN_ISSUER:         return "UnknownIssuerError";
        case ErrorCode::SIGNING_ERROR:          return "SigningError";
        case ErrorCode::UNRESOLVED_DIGEST:      return "UnresolvedDigestError";
        case ErrorCode::DUPLICATE_DIGEST:       return "DuplicateDigestError";
        case ErrorCode::EXPIRED_CREDENTIAL:     return "ExpiredCredentialError";
        case ErrorCode::NOT_YET_VALID:          return "NotYetValidError";
        case ErrorCode::HOLDER_BINDING:         return "HolderBindingError";
        case ErrorCode::MISSING_BINDING:        return "MissingBindingError";
        case ErrorCode::MISSING_BINDING_KEY:    return "MissingBindingKeyError";
        case ErrorCode::POLICY_ERROR:           return "PolicyError";
        case ErrorCode::UNKNOWN_CLAIM_SELECTED: return "UnknownClaimSelectedError";
    }
    return "UnknownError";
}

} // namespace sdjwt
