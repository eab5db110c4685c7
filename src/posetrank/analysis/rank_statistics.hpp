/**
 * @file rank_statistics.hpp
 * @brief Rank probabilities, relative ranks, expected ranks and spreads.
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/partial_order.hpp"
#include "posetrank/common/ranking.hpp"
#include "posetrank/analysis/linear_extension_enumerator.hpp"
#include "posetrank/analysis/rank_interval.hpp"

namespace posetrank
{

/**
 * @brief Summary statistics over a multiset of rankings.
 *
 * @details
 * Produced by `RankAccumulator`. When `exact()` is true the rankings folded
 * were exactly the linear extensions of a partial order, each once; otherwise
 * they were samples and every probability is an estimate.
 *
 * @par Matrices
 * - `rank_probabilities()[i][r - 1]`: fraction of rankings giving element i
 *   rank r. Every row and every column sums to 1.
 * - `relative_ranks()[i][j]`: fraction of rankings with rank(i) < rank(j).
 *   For i != j, `relative_ranks()[i][j] + relative_ranks()[j][i] == 1`;
 *   the diagonal is 0.
 *
 * @par Thread safety
 * - Immutable once constructed; concurrent reads are safe.
 */
class RankStatisticsResult
{
public:
    using Matrix = std::vector<std::vector<double>>;

    size_t size() const noexcept
    {
        return m_expected_ranks.size();
    }

    /**
     * @brief Whether the statistics are exact (full enumeration).
     */
    bool exact() const noexcept
    {
        return m_exact;
    }

    /**
     * @brief Number of rankings folded into the statistics.
     */
    uint64_t observations() const noexcept
    {
        return m_observations;
    }

    /**
     * @brief Number of linear extensions of the analysed order.
     * @throw PosetError with `InvalidState` if the result is not exact.
     */
    ExtensionCount linear_extension_count() const;

    const Matrix& rank_probabilities() const noexcept
    {
        return m_rank_probabilities;
    }

    /**
     * @brief Probability that `element` has rank `r` (1-based).
     * @throw PosetError with `InvalidElementIndex` if either is out of range.
     */
    double rank_probability(ElementIdx element, Rank r) const;

    const Matrix& relative_ranks() const noexcept
    {
        return m_relative_ranks;
    }

    /**
     * @brief Probability that rank(i) < rank(j).
     */
    double relative_rank(ElementIdx i, ElementIdx j) const;

    const std::vector<double>& expected_ranks() const noexcept
    {
        return m_expected_ranks;
    }

    double expected_rank(ElementIdx element) const;

    /**
     * @brief Population standard deviation of each element's rank.
     */
    const std::vector<double>& rank_spreads() const noexcept
    {
        return m_rank_spreads;
    }

    double rank_spread(ElementIdx element) const;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;

    // Allow RankAccumulator to populate results
    friend class RankAccumulator;

private:
    RankStatisticsResult() = default;

    void validate_index(ElementIdx element) const;

    bool m_exact{false};
    uint64_t m_observations{0};
    Matrix m_rank_probabilities;
    Matrix m_relative_ranks;
    std::vector<double> m_expected_ranks;
    std::vector<double> m_rank_spreads;
};

/**
 * @brief Single-pass fold of rankings into rank statistics.
 *
 * @details
 * Keeps integer counters only: one per (element, rank), a rank sum and a sum
 * of squared ranks per element, and one per ordered pair. Rankings are never
 * stored, so the fold can consume a lazy `ExtensionSequence`.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class RankAccumulator
{
public:
    explicit RankAccumulator(size_t element_count);

    size_t element_count() const noexcept
    {
        return m_element_count;
    }

    /**
     * @brief Fold one ranking.
     * @throw PosetError with `InvalidState` if the ranking has a different size.
     */
    void add(const Ranking& ranking);

    uint64_t observations() const noexcept
    {
        return m_observations;
    }

    /**
     * @brief Finish a fold over all linear extensions.
     * @throw PosetError with `InvalidState` if nothing was folded.
     */
    RankStatisticsResult finish_exact() const;

    /**
     * @brief Finish a fold over sampled rankings.
     * @throw PosetError with `InvalidState` if nothing was folded.
     */
    RankStatisticsResult finish_sampled() const;

private:
    RankStatisticsResult finish(bool exact) const;

    size_t m_element_count;
    uint64_t m_observations = 0;

    /// Row-major n x n: [element * n + (rank - 1)].
    std::vector<uint64_t> m_rank_counts;

    std::vector<uint64_t> m_rank_sums;
    std::vector<uint64_t> m_rank_square_sums;

    /// Row-major n x n: [i * n + j] counts rank(i) < rank(j).
    std::vector<uint64_t> m_below_counts;
};

/**
 * @brief Exact rank statistics by full enumeration.
 * @throw DegenerateInputError if the order has fewer than 2 elements.
 * @throw IntractableInputError from the enumerator, unchanged.
 */
RankStatisticsResult compute_rank_statistics(const PartialOrder& order,
                                             const EnumeratorConfig& config = {});

/**
 * @brief Rank statistics component bound to one enumerator configuration.
 *
 * @details
 * Offers the full probabilistic analysis (`compute`) next to the cheap
 * fast path (`rank_interval`) so a caller can fall back to intervals when
 * `compute` reports `IntractableInputError`.
 */
class RankStatistics
{
public:
    explicit RankStatistics(EnumeratorConfig config = {});

    /**
     * @brief Exact rank statistics by full enumeration.
     * @throw DegenerateInputError if the order has fewer than 2 elements.
     * @throw IntractableInputError from the enumerator, unchanged.
     */
    RankStatisticsResult compute(const PartialOrder& order) const;

    /**
     * @brief Rank interval of one element, without enumeration.
     */
    RankInterval rank_interval(const PartialOrder& order, ElementIdx element) const;

    const LinearExtensionEnumerator& enumerator() const noexcept
    {
        return m_enumerator;
    }

    /**
     * @brief Request cooperative cancellation of running computations.
     */
    void request_stop() noexcept
    {
        m_enumerator.request_stop();
    }

private:
    LinearExtensionEnumerator m_enumerator;
};

} // namespace posetrank
