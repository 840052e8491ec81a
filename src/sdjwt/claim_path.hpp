#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sdjwt {

// ============================================================================
// ClaimPath
// ============================================================================
// Location of a claim in the plain (fully disclosed) claim tree, written as
// an RFC 6901 JSON pointer: "/address/street", "/nationalities/1", "" for
// the root. Segments are kept unescaped; array positions are their decimal
// form, so "/0" addresses both member "0" of an object and element 0 of an
// array, as in RFC 6901.

class ClaimPath {
public:
    ClaimPath() = default;

    static std::expected<ClaimPath, std::string> parse(std::string_view pointer);

    ClaimPath child(std::string_view key) const;
    ClaimPath child(std::size_t index) const;
    ClaimPath parent() const;

    const std::vector<std::string>& segments() const { return segments_; }
    bool empty() const { return segments_.empty(); }
    std::size_t depth() const { return segments_.size(); }

    // True if this path equals `other` or lies below it
    bool starts_with(const ClaimPath& other) const;

    std::string to_string() const;

    bool operator==(const ClaimPath& other) const = default;
    bool operator<(const ClaimPath& other) const { return segments_ < other.segments_; }

private:
    std::vector<std::string> segments_;
};

} // namespace sdjwt
