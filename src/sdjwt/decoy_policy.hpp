#pragma once

#include "common/constants.hpp"
#include "sdjwt/claim_path.hpp"
#include <cstddef>

namespace sdjwt {

// ============================================================================
// Decoy policies
// ============================================================================
// Decide how many decoy digests the issuer adds next to the real ones.
// Object decoys go into the "_sd" list, which is sorted, so their placement is
// implicit; array decoys become {"...": digest} elements at random positions.
// Implementations must be safe to call concurrently.

class DecoyPolicy {
public:
    virtual ~DecoyPolicy() = default;

    // Decoys for the object at `path` holding `real_digests` real digests
    virtual std::size_t object_decoys(const ClaimPath& path, std::size_t real_digests) const = 0;

    // Decoys for the array at `path` holding `real_digests` disclosable elements
    virtual std::size_t array_decoys(const ClaimPath& path, std::size_t real_digests) const = 0;
};

class NoDecoys : public DecoyPolicy {
public:
    std::size_t object_decoys(const ClaimPath&, std::size_t) const override { return 0; }
    std::size_t array_decoys(const ClaimPath&, std::size_t) const override { return 0; }
};

// Exactly `count` decoys wherever there is at least one real digest
class FixedDecoys : public DecoyPolicy {
public:
    explicit FixedDecoys(std::size_t count) : count_(count) {}

    std::size_t object_decoys(const ClaimPath& path, std::size_t real_digests) const override;
    std::size_t array_decoys(const ClaimPath& path, std::size_t real_digests) const override;

private:
    std::size_t count_;
};

// Uniform count in [min, max] wherever there is at least one real digest
class RandomDecoys : public DecoyPolicy {
public:
    RandomDecoys(std::size_t min = defaults::DECOY_MIN_ELEMENTS,
                 std::size_t max = defaults::DECOY_MAX_ELEMENTS);

    std::size_t object_decoys(const ClaimPath& path, std::size_t real_digests) const override;
    std::size_t array_decoys(const ClaimPath& path, std::size_t real_digests) const override;

private:
    std::size_t draw() const;

    std::size_t min_;
    std::size_t max_;
};

} // namespace sdjwt
