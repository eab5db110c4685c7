/**
 * @file partial_order_tests.cpp
 * @brief Unit tests for PartialOrder construction, validation and queries.
 */
#include <gtest/gtest.h>
#include "posetrank/common/partial_order.hpp"

using namespace posetrank;

namespace
{

/// 0 <= 1, 0 <= 2, 1 and 2 incomparable.
PartialOrder fork_order()
{
    return PartialOrder::from_relations(3, {{0, 1}, {0, 2}});
}

PartialOrder chain_order(size_t n)
{
    std::vector<RelationPair> pairs;
    for (size_t i = 0; i + 1 < n; ++i)
    {
        pairs.emplace_back(i, i + 1);
    }
    return PartialOrder::transitive_closure_of(n, pairs);
}

} // namespace

// ============================================================================
// Construction and Validation Tests
// ============================================================================

TEST(PartialOrderTests, Construct_FromMatrix)
{
    PartialOrder::Matrix leq = {
        {true, true, true},
        {false, true, false},
        {false, false, true},
    };
    PartialOrder order(leq);
    EXPECT_EQ(order.size(), 3u);
    EXPECT_TRUE(order.leq(0, 1));
    EXPECT_FALSE(order.leq(1, 0));
    EXPECT_TRUE(order.diagnostics().is_valid());
    EXPECT_FALSE(order.diagnostics().has_warnings());
}

TEST(PartialOrderTests, Construct_NonSquare_ThrowsMalformed)
{
    PartialOrder::Matrix leq = {
        {true, false},
        {false, true, false},
    };
    EXPECT_THROW(PartialOrder order(leq), MalformedRelationError);

    RelationDiagnostics diag = PartialOrder::diagnose(leq);
    ASSERT_TRUE(diag.has_errors());
    EXPECT_EQ(diag.errors().front().category, DiagnosticCategory::NotSquare);
    ASSERT_EQ(diag.errors().front().involved_elements.size(), 1u);
    EXPECT_EQ(diag.errors().front().involved_elements[0], 1u);
}

TEST(PartialOrderTests, Construct_NotReflexive_ThrowsMalformed)
{
    PartialOrder::Matrix leq = {
        {true, true},
        {false, false},
    };
    try
    {
        PartialOrder order(leq);
        FAIL() << "Expected MalformedRelationError";
    }
    catch (const MalformedRelationError& e)
    {
        EXPECT_EQ(e.code(), PosetErrorCode::MalformedRelation);
    }

    RelationDiagnostics diag = PartialOrder::diagnose(leq);
    ASSERT_TRUE(diag.has_errors());
    EXPECT_EQ(diag.errors().front().category, DiagnosticCategory::NotReflexive);
}

TEST(PartialOrderTests, Construct_MutualDominance_ThrowsMalformed)
{
    // Antisymmetry violation is a two-element cycle
    EXPECT_THROW(PartialOrder::from_relations(3, {{0, 1}, {1, 0}}), MalformedRelationError);

    PartialOrder::Matrix leq = {
        {true, true, false},
        {true, true, false},
        {false, false, true},
    };
    RelationDiagnostics diag = PartialOrder::diagnose(leq);
    ASSERT_TRUE(diag.has_errors());
    EXPECT_EQ(diag.errors().front().category, DiagnosticCategory::Cycle);
    EXPECT_EQ(diag.errors().front().involved_elements, (std::vector<ElementIdx>{0, 1}));
}

TEST(PartialOrderTests, Construct_ThreeCycle_ThrowsMalformed)
{
    EXPECT_THROW(PartialOrder::from_relations(3, {{0, 1}, {1, 2}, {2, 0}}),
                 MalformedRelationError);
}

TEST(PartialOrderTests, Construct_NotTransitive_WarnsButSucceeds)
{
    PartialOrder order = PartialOrder::from_relations(3, {{0, 1}, {1, 2}});

    const RelationDiagnostics& diag = order.diagnostics();
    EXPECT_TRUE(diag.is_valid());
    ASSERT_TRUE(diag.has_warnings());
    ASSERT_EQ(diag.warnings().size(), 1u);
    EXPECT_EQ(diag.warnings()[0].category, DiagnosticCategory::NotTransitive);
    EXPECT_EQ(diag.warnings()[0].severity, DiagnosticSeverity::Warning);
    EXPECT_EQ(diag.warnings()[0].involved_elements, (std::vector<ElementIdx>{0, 1, 2}));

    // The relation is used as given
    EXPECT_FALSE(order.leq(0, 2));
}

TEST(PartialOrderTests, Construct_TransitivityCheckDisabled_NoWarnings)
{
    PartialOrderOptions options;
    options.check_transitivity = false;
    PartialOrder order = PartialOrder::from_relations(3, {{0, 1}, {1, 2}}, options);
    EXPECT_FALSE(order.diagnostics().has_warnings());
}

TEST(PartialOrderTests, Construct_TransitivityReportsCapped)
{
    // Chain given by its cover relations only: many missing implications
    std::vector<RelationPair> pairs;
    for (size_t i = 0; i + 1 < 8; ++i)
    {
        pairs.emplace_back(i, i + 1);
    }
    PartialOrderOptions options;
    options.max_transitivity_reports = 3;
    PartialOrder order = PartialOrder::from_relations(8, pairs, options);

    EXPECT_EQ(order.diagnostics().warnings().size(), 3u);
    EXPECT_GT(order.diagnostics().suppressed_warnings(), 0u);
}

TEST(PartialOrderTests, FromRelations_OutOfRange_Throws)
{
    try
    {
        PartialOrder::from_relations(2, {{0, 2}});
        FAIL() << "Expected PosetError";
    }
    catch (const PosetError& e)
    {
        EXPECT_EQ(e.code(), PosetErrorCode::InvalidElementIndex);
    }
}

TEST(PartialOrderTests, TransitiveClosureOf_AddsImpliedRelations)
{
    PartialOrder order = chain_order(4);
    EXPECT_TRUE(order.leq(0, 3));
    EXPECT_TRUE(order.leq(1, 3));
    EXPECT_FALSE(order.leq(3, 0));
    EXPECT_FALSE(order.diagnostics().has_warnings());
}

TEST(PartialOrderTests, Diagnose_Summary_MentionsFirstError)
{
    PartialOrder::Matrix leq = {
        {false, false},
        {false, true},
    };
    RelationDiagnostics diag = PartialOrder::diagnose(leq);
    std::string summary = diag.summary();
    EXPECT_NE(summary.find("invalid"), std::string::npos);
    EXPECT_NE(summary.find("reflexive"), std::string::npos);
}

// ============================================================================
// Comparability Tests
// ============================================================================

TEST(PartialOrderTests, Comparability_ClassifiesPairs)
{
    PartialOrder order = fork_order();
    EXPECT_EQ(order.comparability(0, 1), Comparability::LessEqual);
    EXPECT_EQ(order.comparability(1, 0), Comparability::GreaterEqual);
    EXPECT_EQ(order.comparability(1, 2), Comparability::Incomparable);
    EXPECT_EQ(order.comparability(2, 2), Comparability::Equal);
}

TEST(PartialOrderTests, Comparability_InvalidIndex_Throws)
{
    PartialOrder order = fork_order();
    try
    {
        order.comparability(0, 3);
        FAIL() << "Expected PosetError";
    }
    catch (const PosetError& e)
    {
        EXPECT_EQ(e.code(), PosetErrorCode::InvalidElementIndex);
    }
}

TEST(PartialOrderTests, Less_InvalidIndex_Throws)
{
    PartialOrder order = fork_order();
    EXPECT_TRUE(order.less(0, 1));
    EXPECT_FALSE(order.less(1, 1));
    try
    {
        order.less(99, 99);
        FAIL() << "Expected PosetError";
    }
    catch (const PosetError& e)
    {
        EXPECT_EQ(e.code(), PosetErrorCode::InvalidElementIndex);
    }
    EXPECT_THROW(order.less(0, 3), PosetError);
}

TEST(PartialOrderTests, ComparableFraction_Fork)
{
    PartialOrder order = fork_order();
    EXPECT_EQ(order.comparable_pair_count(), 2u);
    EXPECT_DOUBLE_EQ(order.comparable_fraction(), 2.0 / 3.0);
}

TEST(PartialOrderTests, ComparableFraction_ChainIsOne)
{
    EXPECT_DOUBLE_EQ(chain_order(6).comparable_fraction(), 1.0);
}

TEST(PartialOrderTests, ComparableFraction_AntichainIsZero)
{
    PartialOrder order = PartialOrder::from_relations(5, {});
    EXPECT_DOUBLE_EQ(order.comparable_fraction(), 0.0);
}

TEST(PartialOrderTests, ComparableFraction_TooFewElements_ThrowsDegenerate)
{
    PartialOrder single = PartialOrder::from_relations(1, {});
    EXPECT_THROW(single.comparable_fraction(), DegenerateInputError);

    PartialOrder empty = PartialOrder::from_relations(0, {});
    EXPECT_THROW(empty.comparable_fraction(), DegenerateInputError);
}

// ============================================================================
// Neighbourhood Queries
// ============================================================================

TEST(PartialOrderTests, StrictlyBelowAbove_Fork)
{
    PartialOrder order = fork_order();
    EXPECT_EQ(order.strictly_above(0).members(), (std::vector<ElementIdx>{1, 2}));
    EXPECT_TRUE(order.strictly_below(0).empty());
    EXPECT_EQ(order.strictly_below(2).members(), (std::vector<ElementIdx>{0}));
}

TEST(PartialOrderTests, Closures_FollowNonTransitiveChains)
{
    PartialOrderOptions options;
    options.check_transitivity = false;
    PartialOrder order = PartialOrder::from_relations(4, {{0, 1}, {1, 2}}, options);

    EXPECT_EQ(order.down_closure(2).members(), (std::vector<ElementIdx>{0, 1, 2}));
    EXPECT_EQ(order.up_closure(0).members(), (std::vector<ElementIdx>{0, 1, 2}));
    EXPECT_EQ(order.up_closure(3).members(), (std::vector<ElementIdx>{3}));
}

TEST(PartialOrderTests, CoverRelations_ChainReducesToSuccessors)
{
    std::vector<RelationPair> expected{{0, 1}, {1, 2}, {2, 3}};
    EXPECT_EQ(chain_order(4).cover_relations(), expected);
}

TEST(PartialOrderTests, CoverRelations_DiamondKeepsFourEdges)
{
    PartialOrder order = PartialOrder::transitive_closure_of(4, {{0, 1}, {0, 2}, {1, 3}, {2, 3}});
    std::vector<RelationPair> expected{{0, 1}, {0, 2}, {1, 3}, {2, 3}};
    EXPECT_EQ(order.cover_relations(), expected);
}
