#include "sdjwt/decoy_policy.hpp"
#include "common/crypto.hpp"
#include <algorithm>

namespace sdjwt {

std::size_t FixedDecoys::object_decoys(const ClaimPath&, std::size_t real_digests) const {
    return real_digests > 0 ? count_ : 0;
}

std::size_t FixedDecoys::array_decoys(const ClaimPath&, std::size_t real_digests) const {
    return real_digests > 0 ? count_ : 0;
}

RandomDecoys::RandomDecoys(std::size_t min, std::size_t max)
    : min_(std::min(min, max)), max_(std::max(min, max)) {}

std::size_t RandomDecoys::draw() const {
    auto span = static_cast<uint32_t>(max_ - min_ + 1);
    return min_ + crypto::random_uniform(span);
}

std::size_t RandomDecoys::object_decoys(const ClaimPath&, std::size_t real_digests) const {
    return real_digests > 0 ? draw() : 0;
}

std::size_t RandomDecoys::array_decoys(const ClaimPath&, std::size_t real_digests) const {
    return real_digests > 0 ? draw() : 0;
}

} // namespace sdjwt
