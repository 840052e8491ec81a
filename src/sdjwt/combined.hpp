#pragma once

#include "common/types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdjwt {

// ============================================================================
// Combined artifact
// ============================================================================
// <JWS> ( "~" <disclosure> )* "~" [ <holder binding JWT> ]
// An empty last segment means no holder binding JWT is present.

struct CombinedParts {
    std::string jws;
    std::vector<std::string> disclosures;
    std::optional<std::string> binding_jwt;
};

std::expected<CombinedParts, ErrorCode> split_combined(std::string_view combined);

std::string join_combined(
    std::string_view jws,
    const std::vector<std::string>& disclosures,
    const std::optional<std::string>& binding_jwt = std::nullopt);

} // namespace sdjwt
