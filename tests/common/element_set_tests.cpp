#include <gtest/gtest.h>
#include <unordered_set>
#include "posetrank/common/element_set.hpp"
#include "posetrank/common/poset_exceptions.hpp"

using namespace posetrank;

// =============================================================================
// Membership Tests
// =============================================================================

TEST(ElementSetTests, Construct_EmptyOverUniverse) {
    ElementSet set(10);
    EXPECT_EQ(set.universe_size(), 10u);
    EXPECT_EQ(set.count(), 0u);
    EXPECT_TRUE(set.empty());
}

TEST(ElementSetTests, Full_ContainsEveryElement) {
    ElementSet set = ElementSet::full(5);
    EXPECT_EQ(set.count(), 5u);
    for (ElementIdx e = 0; e < 5; ++e) {
        EXPECT_TRUE(set.contains(e));
    }
}

TEST(ElementSetTests, InsertErase_RoundTripsMembership) {
    ElementSet set(8);
    set.insert(3);
    set.insert(7);
    EXPECT_TRUE(set.contains(3));
    EXPECT_TRUE(set.contains(7));
    EXPECT_FALSE(set.contains(4));
    EXPECT_EQ(set.count(), 2u);

    set.erase(3);
    EXPECT_FALSE(set.contains(3));
    EXPECT_EQ(set.count(), 1u);
}

TEST(ElementSetTests, Insert_OutOfUniverse_Throws) {
    ElementSet set(4);
    try {
        set.insert(4);
        FAIL() << "Expected PosetError";
    } catch (const PosetError& e) {
        EXPECT_EQ(e.code(), PosetErrorCode::InvalidElementIndex);
    }
    EXPECT_THROW(set.contains(100), PosetError);
}

// =============================================================================
// Multi-word Tests
// =============================================================================

TEST(ElementSetTests, LargeUniverse_MembersAcrossWords) {
    ElementSet set(200);
    set.insert(0);
    set.insert(63);
    set.insert(64);
    set.insert(130);
    set.insert(199);

    EXPECT_EQ(set.count(), 5u);
    std::vector<ElementIdx> expected{0, 63, 64, 130, 199};
    EXPECT_EQ(set.members(), expected);
}

TEST(ElementSetTests, Full_ExactlySixtyFour) {
    ElementSet set = ElementSet::full(64);
    EXPECT_EQ(set.count(), 64u);
    EXPECT_TRUE(set.contains(63));
}

TEST(ElementSetTests, Intersects_DetectsSharedHighMember) {
    ElementSet a(150);
    ElementSet b(150);
    a.insert(1);
    b.insert(2);
    EXPECT_FALSE(a.intersects(b));

    a.insert(140);
    b.insert(140);
    EXPECT_TRUE(a.intersects(b));
}

// =============================================================================
// Equality and Hashing Tests
// =============================================================================

TEST(ElementSetTests, Equality_SameMembersSameUniverse) {
    ElementSet a(70);
    ElementSet b(70);
    a.insert(65);
    b.insert(65);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());

    b.insert(2);
    EXPECT_NE(a, b);
}

TEST(ElementSetTests, Equality_DifferentUniverseNotEqual) {
    ElementSet a(3);
    ElementSet b(4);
    EXPECT_NE(a, b);
}

TEST(ElementSetTests, Hash_UsableInUnorderedSet) {
    std::unordered_set<ElementSet, ElementSetHash> seen;
    for (ElementIdx e = 0; e < 10; ++e) {
        ElementSet s(10);
        s.insert(e);
        seen.insert(s);
    }
    ElementSet duplicate(10);
    duplicate.insert(4);
    seen.insert(duplicate);
    EXPECT_EQ(seen.size(), 10u);
}

TEST(ElementSetTests, ForEach_VisitsInIncreasingOrder) {
    ElementSet set(100);
    set.insert(90);
    set.insert(5);
    set.insert(64);
    std::vector<ElementIdx> visited;
    set.for_each([&](ElementIdx e) { visited.push_back(e); });
    std::vector<ElementIdx> expected{5, 64, 90};
    EXPECT_EQ(visited, expected);
}
