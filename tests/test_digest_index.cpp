#include <gtest/gtest.h>
#include "sdjwt/digest_index.hpp"
#include <utility>

using namespace sdjwt;

namespace {
std::vector<Disclosure> sample_disclosures() {
    std::vector<Disclosure> out;
    out.push_back(*make_disclosure("salt-a", "given_name", "Alice", "sha-256"));
    out.push_back(*make_disclosure("salt-b", "family_name", "Doe", "sha-256"));
    out.push_back(*make_disclosure("salt-c", std::nullopt, "DE", "sha-256"));
    return out;
}

template <typename V>
concept indexable = requires(V&& v) { DigestIndex::build(std::forward<V>(v)); };

template <typename V>
concept indexable_by_wrapper = requires(V&& v) { build_index(std::forward<V>(v)); };
} // anonymous namespace

TEST(DigestIndexTest, BuildAndFind) {
    auto disclosures = sample_disclosures();
    auto index = build_index(disclosures);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->size(), 3u);

    for (const auto& d : disclosures) {
        const Disclosure* found = index->find(d.digest);
        ASSERT_NE(found, nullptr);
        EXPECT_EQ(found, &d);
    }
    EXPECT_EQ(index->find("unknown"), nullptr);
}

TEST(DigestIndexTest, IdenticalTriplesCollide) {
    std::vector<Disclosure> disclosures;
    disclosures.push_back(*make_disclosure("same-salt", "given_name", "Alice", "sha-256"));
    disclosures.push_back(*make_disclosure("same-salt", "given_name", "Alice", "sha-256"));

    auto index = build_index(disclosures);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error(), ErrorCode::DUPLICATE_DIGEST);
}

TEST(DigestIndexTest, MarkUsedOnce) {
    auto disclosures = sample_disclosures();
    auto index = build_index(disclosures);
    ASSERT_TRUE(index.has_value());

    EXPECT_TRUE(index->mark_used(disclosures[1].digest));
    EXPECT_FALSE(index->mark_used(disclosures[1].digest));
    EXPECT_FALSE(index->mark_used("unknown"));
}

TEST(DigestIndexTest, UnusedKeepsDisclosureOrder) {
    auto disclosures = sample_disclosures();
    auto index = build_index(disclosures);
    ASSERT_TRUE(index.has_value());

    index->mark_used(disclosures[1].digest);
    auto unused = index->unused();
    ASSERT_EQ(unused.size(), 2u);
    EXPECT_EQ(unused[0], disclosures[0].digest);
    EXPECT_EQ(unused[1], disclosures[2].digest);
}

TEST(DigestIndexTest, EmptyIndex) {
    std::vector<Disclosure> none;
    auto index = build_index(none);
    ASSERT_TRUE(index.has_value());
    EXPECT_TRUE(index->empty());
    EXPECT_TRUE(index->unused().empty());
}

TEST(DigestIndexTest, RequiresLvalueDisclosures) {
    // A temporary list would leave the index pointing at destroyed disclosures
    static_assert(!indexable<std::vector<Disclosure>>);
    static_assert(!indexable_by_wrapper<std::vector<Disclosure>>);
    static_assert(indexable<const std::vector<Disclosure>&>);
    static_assert(indexable_by_wrapper<std::vector<Disclosure>&>);

    auto disclosures = sample_disclosures();
    auto index = DigestIndex::build(disclosures);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->find(disclosures[0].digest), &disclosures[0]);
}
