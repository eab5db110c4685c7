/**
 * @file rank_statistics.cpp
 */
#include "posetrank/analysis/rank_statistics.hpp"
#include "posetrank/common/poset_exceptions.hpp"

#include <cmath>
#include <sstream>

namespace posetrank
{

// ============================================================================
// RankStatisticsResult
// ============================================================================

void RankStatisticsResult::validate_index(ElementIdx element) const
{
    if (element >= size())
    {
        throw PosetError(
            PosetErrorCode::InvalidElementIndex,
            "Element index " + std::to_string(element) + " does not exist (size " +
                std::to_string(size()) + ")");
    }
}

ExtensionCount RankStatisticsResult::linear_extension_count() const
{
    if (!m_exact)
    {
        throw PosetError(PosetErrorCode::InvalidState,
                         "Sampled rank statistics do not know the linear extension count");
    }
    return ExtensionCount(m_observations);
}

double RankStatisticsResult::rank_probability(ElementIdx element, Rank r) const
{
    validate_index(element);
    if (r < 1 || r > size())
    {
        throw PosetError(
            PosetErrorCode::InvalidElementIndex,
            "Rank " + std::to_string(r) + " is outside 1.." + std::to_string(size()));
    }
    return m_rank_probabilities[element][r - 1];
}

double RankStatisticsResult::relative_rank(ElementIdx i, ElementIdx j) const
{
    validate_index(i);
    validate_index(j);
    return m_relative_ranks[i][j];
}

double RankStatisticsResult::expected_rank(ElementIdx element) const
{
    validate_index(element);
    return m_expected_ranks[element];
}

double RankStatisticsResult::rank_spread(ElementIdx element) const
{
    validate_index(element);
    return m_rank_spreads[element];
}

std::string RankStatisticsResult::summary() const
{
    std::ostringstream out;
    out << (m_exact ? "Exact" : "Sampled") << " rank statistics (elements=" << size()
        << (m_exact ? ", extensions=" : ", samples=") << m_observations << ")";
    return out.str();
}

// ============================================================================
// RankAccumulator
// ============================================================================

RankAccumulator::RankAccumulator(size_t element_count)
    : m_element_count(element_count)
    , m_rank_counts(element_count * element_count, 0)
    , m_rank_sums(element_count, 0)
    , m_rank_square_sums(element_count, 0)
    , m_below_counts(element_count * element_count, 0)
{
}

void RankAccumulator::add(const Ranking& ranking)
{
    const size_t n = m_element_count;
    if (ranking.size() != n)
    {
        throw PosetError(
            PosetErrorCode::InvalidState,
            "Cannot fold a ranking of " + std::to_string(ranking.size()) +
                " elements into statistics over " + std::to_string(n) + " elements");
    }

    const std::vector<Rank>& ranks = ranking.ranks();
    for (size_t i = 0; i < n; ++i)
    {
        const uint64_t r = ranks[i];
        ++m_rank_counts[i * n + (r - 1)];
        m_rank_sums[i] += r;
        m_rank_square_sums[i] += r * r;

        for (size_t j = 0; j < n; ++j)
        {
            if (ranks[i] < ranks[j])
            {
                ++m_below_counts[i * n + j];
            }
        }
    }
    ++m_observations;
}

RankStatisticsResult RankAccumulator::finish_exact() const
{
    return finish(true);
}

RankStatisticsResult RankAccumulator::finish_sampled() const
{
    return finish(false);
}

RankStatisticsResult RankAccumulator::finish(bool exact) const
{
    if (m_observations == 0)
    {
        throw PosetError(PosetErrorCode::InvalidState,
                         "Rank statistics need at least one ranking");
    }

    const size_t n = m_element_count;
    const double total = static_cast<double>(m_observations);

    RankStatisticsResult result;
    result.m_exact = exact;
    result.m_observations = m_observations;
    result.m_rank_probabilities.assign(n, std::vector<double>(n, 0.0));
    result.m_relative_ranks.assign(n, std::vector<double>(n, 0.0));
    result.m_expected_ranks.assign(n, 0.0);
    result.m_rank_spreads.assign(n, 0.0);

    for (size_t i = 0; i < n; ++i)
    {
        for (size_t k = 0; k < n; ++k)
        {
            result.m_rank_probabilities[i][k] = static_cast<double>(m_rank_counts[i * n + k]) / total;
            result.m_relative_ranks[i][k] = static_cast<double>(m_below_counts[i * n + k]) / total;
        }

        result.m_expected_ranks[i] = static_cast<double>(m_rank_sums[i]) / total;

        // Variance = (N * sum(r^2) - sum(r)^2) / N^2, numerator computed exactly
        ExtensionCount numerator = ExtensionCount(m_observations) * m_rank_square_sums[i];
        numerator -= ExtensionCount(m_rank_sums[i]) * m_rank_sums[i];
        double variance = to_double(numerator) / (total * total);
        result.m_rank_spreads[i] = variance > 0.0 ? std::sqrt(variance) : 0.0;
    }

    return result;
}

// ============================================================================
// Rank statistics computation
// ============================================================================

RankStatisticsResult compute_rank_statistics(const PartialOrder& order, const EnumeratorConfig& config)
{
    return RankStatistics(config).compute(order);
}

RankStatistics::RankStatistics(EnumeratorConfig config)
    : m_enumerator(config)
{
}

RankStatisticsResult RankStatistics::compute(const PartialOrder& order) const
{
    if (order.size() < 2)
    {
        throw DegenerateInputError(
            "Rank statistics need at least 2 elements, got " + std::to_string(order.size()));
    }

    RankAccumulator accumulator(order.size());
    for (const Ranking& ranking : m_enumerator.enumerate(order))
    {
        accumulator.add(ranking);
    }
    return accumulator.finish_exact();
}

RankInterval RankStatistics::rank_interval(const PartialOrder& order, ElementIdx element) const
{
    return posetrank::rank_interval(order, element);
}

} // namespace posetrank
