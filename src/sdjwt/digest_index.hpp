#pragma once

#include "sdjwt/disclosure.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sdjwt {

// ============================================================================
// DigestIndex
// ============================================================================
// digest -> disclosure. Built once from a disclosure list; a repeated digest
// is rejected rather than overwritten. Tracks which digests a reconstruction
// walk has consumed so leftovers can be detected.

class DigestIndex {
public:
    static std::expected<DigestIndex, ErrorCode> build(const std::vector<Disclosure>& disclosures);
    // Entries point into the disclosure list, which must outlive the index
    static std::expected<DigestIndex, ErrorCode> build(std::vector<Disclosure>&&) = delete;

    const Disclosure* find(std::string_view digest) const;

    // Returns false if the digest was already consumed
    bool mark_used(std::string_view digest);

    // Digests never consumed, in disclosure order
    std::vector<std::string> unused() const;

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

private:
    struct Entry {
        const Disclosure* disclosure = nullptr;
        bool used = false;
    };

    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
};

// Convenience wrapper matching the protocol vocabulary
inline std::expected<DigestIndex, ErrorCode> build_index(const std::vector<Disclosure>& disclosures) {
    return DigestIndex::build(disclosures);
}
std::expected<DigestIndex, ErrorCode> build_index(std::vector<Disclosure>&&) = delete;

} // namespace sdjwt
