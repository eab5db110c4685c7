/**
 * @file rank_approximation.cpp
 */
#include "posetrank/analysis/rank_approximation.hpp"
#include "posetrank/analysis/rank_interval.hpp"
#include "posetrank/common/poset_exceptions.hpp"

#include <random>

namespace posetrank
{

std::vector<double> approx_expected_ranks(const PartialOrder& order)
{
    const size_t n = order.size();
    if (n < 2)
    {
        throw DegenerateInputError(
            "Expected rank approximation needs at least 2 elements, got " + std::to_string(n));
    }

    std::vector<double> result(n, 0.0);
    for (ElementIdx i = 0; i < n; ++i)
    {
        // Closures include i itself
        const size_t below = order.down_closure(i).count() - 1;
        const size_t above = order.up_closure(i).count() - 1;
        const size_t incomparable = n - 1 - below - above;

        result[i] = static_cast<double>(below + 1) * static_cast<double>(n + 1) /
                    static_cast<double>(n + 1 - incomparable);
    }
    return result;
}

RankStatisticsResult sample_rank_statistics(const PartialOrder& order, const SamplerConfig& config)
{
    const size_t n = order.size();
    if (n < 2)
    {
        throw DegenerateInputError(
            "Rank sampling needs at least 2 elements, got " + std::to_string(n));
    }
    if (config.sample_count == 0)
    {
        throw PosetError(PosetErrorCode::InvalidState, "Rank sampling needs a positive sample count");
    }

    const size_t burn_in = config.burn_in != 0 ? config.burn_in : n * n * n;
    const size_t thinning = config.thinning != 0 ? config.thinning : n;
    const PartialOrder::Matrix& leq = order.matrix();

    std::mt19937_64 rng(config.seed);
    std::uniform_int_distribution<size_t> position(0, n - 2);
    std::bernoulli_distribution coin(0.5);

    // Any linear extension is a valid starting state
    std::vector<ElementIdx> state = extremal_ranking(order, 0, ExtremalPlacement::Lowest).bottom_up();

    auto step = [&]() {
        const size_t p = position(rng);
        if (!coin(rng))
        {
            return;
        }
        // Adjacent elements in an extension can swap unless they are related
        if (!leq[state[p]][state[p + 1]])
        {
            std::swap(state[p], state[p + 1]);
        }
    };

    for (size_t s = 0; s < burn_in; ++s)
    {
        step();
    }

    RankAccumulator accumulator(n);
    for (size_t sample = 0; sample < config.sample_count; ++sample)
    {
        for (size_t s = 0; s < thinning; ++s)
        {
            step();
        }
        accumulator.add(Ranking::from_bottom_up(state));
    }
    return accumulator.finish_sampled();
}

} // namespace posetrank
