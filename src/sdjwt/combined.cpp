#include "sdjwt/combined.hpp"
#include "common/constants.hpp"
#include "common/logger.hpp"

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.combined"); }
} // anonymous namespace

std::expected<CombinedParts, ErrorCode> split_combined(std::string_view combined) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (true) {
        auto pos = combined.find(format::COMBINED_SEPARATOR, start);
        if (pos == std::string_view::npos) {
            segments.push_back(combined.substr(start));
            break;
        }
        segments.push_back(combined.substr(start, pos - start));
        start = pos + 1;
    }

    if (segments.size() < 2) {
        log().debug("Combined artifact has no separator");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }
    if (segments.front().empty()) {
        log().debug("Combined artifact has an empty JWS segment");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    CombinedParts parts;
    parts.jws = std::string(segments.front());

    for (size_t i = 1; i + 1 < segments.size(); ++i) {
        if (segments[i].empty()) {
            log().debug("Combined artifact has an empty disclosure at position {}", i);
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }
        parts.disclosures.emplace_back(segments[i]);
    }

    if (!segments.back().empty()) {
        parts.binding_jwt = std::string(segments.back());
    }

    return parts;
}

std::string join_combined(
    std::string_view jws,
    const std::vector<std::string>& disclosures,
    const std::optional<std::string>& binding_jwt) {

    std::string out(jws);
    out.push_back(format::COMBINED_SEPARATOR);
    for (const auto& d : disclosures) {
        out += d;
        out.push_back(format::COMBINED_SEPARATOR);
    }
    if (binding_jwt) {
        out += *binding_jwt;
    }
    return out;
}

} // namespace sdjwt
