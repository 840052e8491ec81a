#include "sdjwt/digest_index.hpp"
#include "common/logger.hpp"

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.index"); }
} // anonymous namespace

std::expected<DigestIndex, ErrorCode> DigestIndex::build(const std::vector<Disclosure>& disclosures) {
    DigestIndex index;
    index.entries_.reserve(disclosures.size());
    index.order_.reserve(disclosures.size());

    for (const auto& d : disclosures) {
        auto [it, inserted] = index.entries_.try_emplace(d.digest, Entry{&d, false});
        if (!inserted) {
            log().warn("Duplicate disclosure digest {}...", d.digest.substr(0, 8));
            return std::unexpected(ErrorCode::DUPLICATE_DIGEST);
        }
        index.order_.push_back(d.digest);
    }

    return index;
}

const Disclosure* DigestIndex::find(std::string_view digest) const {
    auto it = entries_.find(std::string(digest));
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.disclosure;
}

bool DigestIndex::mark_used(std::string_view digest) {
    auto it = entries_.find(std::string(digest));
    if (it == entries_.end() || it->second.used) {
        return false;
    }
    it->second.used = true;
    return true;
}

std::vector<std::string> DigestIndex::unused() const {
    std::vector<std::string> result;
    for (const auto& digest : order_) {
        if (!entries_.at(digest).used) {
            result.push_back(digest);
        }
    }
    return result;
}

} // namespace sdjwt
