/**
 * @file partial_order.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/element_set.hpp"
#include "posetrank/common/poset_enums.hpp"
#include "posetrank/common/poset_exceptions.hpp"
#include "posetrank/common/relation_diagnostics.hpp"

namespace posetrank
{

/**
 * @brief Options controlling how a comparability matrix is validated.
 */
struct PartialOrderOptions
{
    /**
     * @brief Whether to run the O(n^3) transitivity check.
     * @details Violations are reported as warnings, never as errors.
     */
    bool check_transitivity{true};

    /**
     * @brief Maximum number of transitivity warnings recorded as items.
     * @details Further violations are only counted.
     */
    size_t max_transitivity_reports{16};
};

/**
 * @brief A dominance relation over a finite element set.
 *
 * @details
 * `PartialOrder` holds an n x n boolean matrix `leq` where `leq(i, j)` means
 * "i is less than or equal to j", i.e. i is dominated by j and no valid
 * centrality index ranks i above j. The matrix is produced externally by
 * whichever dominance derivation the caller chooses (neighborhood-inclusion,
 * positional dominance, ...).
 *
 * @par Preconditions
 * - The matrix is square and reflexive. Violations throw
 *   `MalformedRelationError`.
 * - The strict part of the relation is acyclic. Violations (including two
 *   distinct elements dominating each other) throw `MalformedRelationError`.
 * - The relation is transitively closed. This is not computed internally;
 *   violations are reported as `NotTransitive` warnings in `diagnostics()`
 *   and the relation is used as given.
 *
 * @par Thread safety
 * - Immutable after construction.
 * - Concurrent reads are safe.
 */
class PartialOrder
{
public:
    using Matrix = std::vector<std::vector<bool>>;

    /**
     * @brief Construct a partial order from a comparability matrix.
     * @param leq The matrix; `leq[i][j]` is true when i <= j.
     * @param options Validation options.
     * @throw MalformedRelationError if the matrix is not square, not
     *        reflexive, or its strict part contains a cycle.
     */
    explicit PartialOrder(Matrix leq, PartialOrderOptions options = {});

    /**
     * @brief Construct a partial order from (lower, upper) pairs.
     * @details The reflexive diagonal is added automatically. The pairs are
     *          used as given; their transitive closure is not computed.
     * @throw PosetError with `InvalidElementIndex` if a pair names an element
     *        outside 0..n-1, or `MalformedRelationError` as for the matrix
     *        constructor.
     */
    static PartialOrder from_relations(size_t n,
                                       const std::vector<RelationPair>& pairs,
                                       PartialOrderOptions options = {});

    /**
     * @brief Construct the reflexive transitive closure of (lower, upper) pairs.
     * @throw PosetError with `InvalidElementIndex` for out-of-range pairs, or
     *        `MalformedRelationError` if the pairs contain a cycle.
     */
    static PartialOrder transitive_closure_of(size_t n,
                                              const std::vector<RelationPair>& pairs,
                                              PartialOrderOptions options = {});

    /**
     * @brief Validate a matrix without constructing an order.
     * @return Diagnostics describing every error and warning found.
     */
    static RelationDiagnostics diagnose(const Matrix& leq, const PartialOrderOptions& options = {});

    /**
     * @brief Number of elements n.
     */
    size_t size() const noexcept
    {
        return m_size;
    }

    /**
     * @brief Check whether i <= j.
     * @throw PosetError with `InvalidElementIndex` for an invalid index.
     */
    bool leq(ElementIdx i, ElementIdx j) const;

    /**
     * @brief Check whether i < j, i.e. i <= j and i != j.
     */
    bool less(ElementIdx i, ElementIdx j) const;

    /**
     * @brief Classify an ordered pair of elements.
     * @return `Equal` only when i == j.
     * @throw PosetError with `InvalidElementIndex` for an invalid index.
     */
    Comparability comparability(ElementIdx i, ElementIdx j) const;

    /**
     * @brief Number of unordered pairs {i, j}, i != j, that are comparable.
     */
    size_t comparable_pair_count() const noexcept
    {
        return m_comparable_pairs;
    }

    /**
     * @brief Fraction of unordered pairs that are comparable.
     * @return comparable_pair_count() / (n choose 2), in [0, 1].
     * @throw DegenerateInputError if n < 2.
     */
    double comparable_fraction() const;

    /**
     * @brief Elements j != i with j <= i, as given by the matrix.
     */
    const ElementSet& strictly_below(ElementIdx i) const;

    /**
     * @brief Elements j != i with i <= j, as given by the matrix.
     */
    const ElementSet& strictly_above(ElementIdx i) const;

    /**
     * @brief Elements from which i is reachable through the strict relation,
     *        including i itself.
     * @details Equal to `strictly_below(i)` plus i when the relation is
     *          transitive; also correct for approximately transitive input.
     */
    ElementSet down_closure(ElementIdx i) const;

    /**
     * @brief Elements reachable from i through the strict relation,
     *        including i itself.
     */
    ElementSet up_closure(ElementIdx i) const;

    /**
     * @brief The cover relation (transitive reduction) of the order.
     * @return Pairs (lower, upper) with lower < upper and no element strictly
     *         between them, sorted lexicographically.
     */
    std::vector<RelationPair> cover_relations() const;

    /**
     * @brief Warnings recorded during construction.
     */
    const RelationDiagnostics& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Matrix& matrix() const noexcept
    {
        return m_leq;
    }

private:
    void validate_index(ElementIdx i) const;

    /// Reachability over a per-element adjacency of strict relations.
    ElementSet closure_from(ElementIdx i, const std::vector<ElementSet>& adjacency) const;

    size_t m_size = 0;
    Matrix m_leq;

    /// m_below[i] = { j != i : leq[j][i] }.
    std::vector<ElementSet> m_below;

    /// m_above[i] = { j != i : leq[i][j] }.
    std::vector<ElementSet> m_above;

    size_t m_comparable_pairs = 0;
    RelationDiagnostics m_diagnostics;
};

} // namespace posetrank
