#include "posetrank/analysis/linear_extension_enumerator.hpp"
#include "posetrank/analysis/rank_interval.hpp"
#include "posetrank/analysis/rank_statistics.hpp"
#include "posetrank/common/partial_order.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>

using namespace posetrank;

namespace
{

/// Neighborhood-inclusion dominance of a small toy network, precomputed.
PartialOrder toy_order()
{
    return PartialOrder::transitive_closure_of(
        6, {{0, 2}, {1, 2}, {1, 3}, {2, 4}, {3, 4}, {3, 5}});
}

void print_matrix(const RankStatisticsResult::Matrix& matrix)
{
    for (const auto& row : matrix)
    {
        std::cout << "   ";
        for (double value : row)
        {
            std::cout << " " << std::setw(6) << value;
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== posetrank ======\n" << std::flush;

        PartialOrder order = toy_order();
        std::cout << order.diagnostics().summary() << "\n";
        std::cout << "Elements: " << order.size() << "\n";
        std::cout << "Comparable fraction: " << order.comparable_fraction() << "\n";
        std::cout << "Linear extensions: " << posetrank::to_string(count_linear_extensions(order)) << "\n";

        std::cout << "Rank intervals:\n";
        std::vector<RankInterval> intervals = rank_intervals(order);
        for (ElementIdx e = 0; e < intervals.size(); ++e)
        {
            std::cout << "    " << e << ": [" << intervals[e].min_rank << ", "
                      << intervals[e].max_rank << "]\n";
        }

        RankStatisticsResult stats = compute_rank_statistics(order);
        std::cout << stats.summary() << "\n";
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "Rank probabilities (row = element, column = rank):\n";
        print_matrix(stats.rank_probabilities());
        std::cout << "Relative ranks P(rank(i) < rank(j)):\n";
        print_matrix(stats.relative_ranks());
        std::cout << "Expected rank +- spread:\n";
        for (ElementIdx e = 0; e < stats.size(); ++e)
        {
            std::cout << "    " << e << ": " << stats.expected_rank(e) << " +- "
                      << stats.rank_spread(e) << "\n";
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
