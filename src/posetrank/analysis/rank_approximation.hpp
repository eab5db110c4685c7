/**
 * @file rank_approximation.hpp
 * @brief Approximate rank analysis for orders too large to enumerate.
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/partial_order.hpp"
#include "posetrank/analysis/rank_statistics.hpp"

namespace posetrank
{

/**
 * @brief Configuration for Markov chain sampling of linear extensions.
 */
struct SamplerConfig
{
    /**
     * @brief Number of rankings folded into the estimate. Must be positive.
     */
    size_t sample_count{10000};

    /**
     * @brief Chain steps discarded before the first sample.
     * @details 0 means n^3.
     */
    size_t burn_in{0};

    /**
     * @brief Chain steps between consecutive samples.
     * @details 0 means n.
     */
    size_t thinning{0};

    /**
     * @brief Seed of the pseudo random generator.
     * @details Equal seeds give equal results with the same standard library;
     *          the distributions used are implementation-defined, so results
     *          may differ across platforms.
     */
    uint64_t seed{0};
};

/**
 * @brief Expected ranks under the local partial order model.
 *
 * @details
 * For each element i with `s` elements strictly below it and `c` elements
 * incomparable to it, the estimate is `(s + 1) (n + 1) / (n + 1 - c)`. The
 * estimate is exact for total orders and for the order without relations,
 * and costs O(n^2) per element.
 *
 * @throw DegenerateInputError if the order has fewer than 2 elements.
 */
std::vector<double> approx_expected_ranks(const PartialOrder& order);

/**
 * @brief Estimate rank statistics by sampling linear extensions.
 *
 * @details
 * Runs the random adjacent transposition chain: starting from a linear
 * extension, each step picks an adjacent pair of positions uniformly and,
 * with probability 1/2, swaps the two elements if they are incomparable. The
 * chain's stationary distribution is uniform over all linear extensions.
 * After `burn_in` steps, one ranking is folded every `thinning` steps until
 * `sample_count` rankings were folded.
 *
 * @return A non-exact `RankStatisticsResult`.
 * @throw DegenerateInputError if the order has fewer than 2 elements.
 * @throw PosetError with `InvalidState` if `sample_count` is 0.
 */
RankStatisticsResult sample_rank_statistics(const PartialOrder& order, const SamplerConfig& config = {});

} // namespace posetrank
