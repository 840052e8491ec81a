#include "sdjwt/claim_path.hpp"
#include <algorithm>

namespace sdjwt {

std::expected<ClaimPath, std::string> ClaimPath::parse(std::string_view pointer) {
    ClaimPath path;
    if (pointer.empty()) {
        return path;
    }
    if (pointer.front() != '/') {
        return std::unexpected("JSON pointer must start with '/': " + std::string(pointer));
    }

    std::string segment;
    for (size_t i = 1; i <= pointer.size(); ++i) {
        if (i == pointer.size() || pointer[i] == '/') {
            path.segments_.push_back(std::move(segment));
            segment.clear();
            continue;
        }
        char c = pointer[i];
        if (c == '~') {
            if (i + 1 >= pointer.size() || (pointer[i + 1] != '0' && pointer[i + 1] != '1')) {
                return std::unexpected("Invalid escape in JSON pointer: " + std::string(pointer));
            }
            segment.push_back(pointer[i + 1] == '0' ? '~' : '/');
            ++i;
        } else {
            segment.push_back(c);
        }
    }

    return path;
}

ClaimPath ClaimPath::child(std::string_view key) const {
    ClaimPath result = *this;
    result.segments_.emplace_back(key);
    return result;
}

ClaimPath ClaimPath::child(std::size_t index) const {
    ClaimPath result = *this;
    result.segments_.push_back(std::to_string(index));
    return result;
}

ClaimPath ClaimPath::parent() const {
    ClaimPath result = *this;
    if (!result.segments_.empty()) {
        result.segments_.pop_back();
    }
    return result;
}

bool ClaimPath::starts_with(const ClaimPath& other) const {
    if (other.segments_.size() > segments_.size()) return false;
    return std::equal(other.segments_.begin(), other.segments_.end(), segments_.begin());
}

std::string ClaimPath::to_string() const {
    std::string out;
    for (const auto& segment : segments_) {
        out.push_back('/');
        for (char c : segment) {
            if (c == '~') out += "~0";
            else if (c == '/') out += "~1";
            else out.push_back(c);
        }
    }
    return out;
}

} // namespace sdjwt
