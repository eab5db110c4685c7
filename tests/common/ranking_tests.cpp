#include <gtest/gtest.h>
#include "posetrank/common/partial_order.hpp"
#include "posetrank/common/ranking.hpp"

using namespace posetrank;

// =============================================================================
// Construction Tests
// =============================================================================

TEST(RankingTests, Construct_FromRanks) {
    Ranking ranking(std::vector<Rank>{2, 3, 1});
    EXPECT_EQ(ranking.size(), 3u);
    EXPECT_EQ(ranking.rank(0), 2u);
    EXPECT_EQ(ranking.rank(2), 1u);
    EXPECT_EQ(ranking.bottom_up(), (std::vector<ElementIdx>{2, 0, 1}));
}

TEST(RankingTests, Construct_NotAPermutation_Throws) {
    EXPECT_THROW(Ranking ranking(std::vector<Rank>{1, 1, 2}), PosetError);
    EXPECT_THROW(Ranking ranking(std::vector<Rank>{0, 1, 2}), PosetError);
    EXPECT_THROW(Ranking ranking(std::vector<Rank>{1, 2, 4}), PosetError);
}

TEST(RankingTests, FromBottomUp_InvertsBottomUp) {
    Ranking ranking = Ranking::from_bottom_up({3, 0, 2, 1});
    EXPECT_EQ(ranking.rank(3), 1u);
    EXPECT_EQ(ranking.rank(1), 4u);
    EXPECT_EQ(ranking.bottom_up(), (std::vector<ElementIdx>{3, 0, 2, 1}));
    EXPECT_EQ(ranking.to_string(), "[3, 0, 2, 1]");
}

TEST(RankingTests, FromBottomUp_Duplicate_Throws) {
    EXPECT_THROW(Ranking::from_bottom_up({0, 0}), PosetError);
    EXPECT_THROW(Ranking::from_bottom_up({0, 5}), PosetError);
}

TEST(RankingTests, Rank_InvalidIndex_Throws) {
    Ranking ranking = Ranking::from_bottom_up({0, 1});
    EXPECT_THROW(ranking.rank(2), PosetError);
}

// =============================================================================
// Linear Extension Check Tests
// =============================================================================

TEST(RankingTests, Respects_ForkOrder) {
    PartialOrder order = PartialOrder::from_relations(3, {{0, 1}, {0, 2}});
    EXPECT_TRUE(Ranking::from_bottom_up({0, 1, 2}).respects(order));
    EXPECT_TRUE(Ranking::from_bottom_up({0, 2, 1}).respects(order));
    EXPECT_FALSE(Ranking::from_bottom_up({1, 0, 2}).respects(order));
}

TEST(RankingTests, Respects_SizeMismatch_False) {
    PartialOrder order = PartialOrder::from_relations(3, {});
    EXPECT_FALSE(Ranking::from_bottom_up({0, 1}).respects(order));
}

TEST(RankingTests, Ordering_UsableAsSetKey) {
    Ranking a = Ranking::from_bottom_up({0, 1, 2});
    Ranking b = Ranking::from_bottom_up({0, 2, 1});
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b || b < a);
    EXPECT_EQ(a, Ranking(std::vector<Rank>{1, 2, 3}));
}
