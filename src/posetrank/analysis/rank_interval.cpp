/**
 * @file rank_interval.cpp
 */
#include "posetrank/analysis/rank_interval.hpp"
#include "posetrank/common/poset_exceptions.hpp"

#include <queue>

namespace posetrank
{

Ranking extremal_ranking(const PartialOrder& order, ElementIdx element, ExtremalPlacement placement)
{
    const size_t n = order.size();

    // Validates the index
    ElementSet preferred = placement == ExtremalPlacement::Lowest ? order.down_closure(element)
                                                                  : order.up_closure(element);
    if (placement == ExtremalPlacement::Highest)
    {
        // Prefer everything that does not have to sit above the element
        ElementSet outside(n);
        for (ElementIdx e = 0; e < n; ++e)
        {
            if (!preferred.contains(e))
            {
                outside.insert(e);
            }
        }
        preferred = std::move(outside);
    }

    std::vector<size_t> in_degree(n, 0);
    for (ElementIdx e = 0; e < n; ++e)
    {
        in_degree[e] = order.strictly_below(e).count();
    }

    std::queue<ElementIdx> preferred_ready;
    std::queue<ElementIdx> other_ready;
    auto make_ready = [&](ElementIdx e) {
        if (preferred.contains(e))
        {
            preferred_ready.push(e);
        }
        else
        {
            other_ready.push(e);
        }
    };

    for (ElementIdx e = 0; e < n; ++e)
    {
        if (in_degree[e] == 0)
        {
            make_ready(e);
        }
    }

    std::vector<ElementIdx> bottom_up;
    bottom_up.reserve(n);
    while (!preferred_ready.empty() || !other_ready.empty())
    {
        std::queue<ElementIdx>& source = preferred_ready.empty() ? other_ready : preferred_ready;
        ElementIdx e = source.front();
        source.pop();
        bottom_up.push_back(e);

        order.strictly_above(e).for_each([&](ElementIdx succ) {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                make_ready(succ);
            }
        });
    }

    if (bottom_up.size() != n)
    {
        // PartialOrder construction rejects cycles, so this indicates a bug
        throw PosetError(PosetErrorCode::InvalidState,
                         "Extremal ranking placed " + std::to_string(bottom_up.size()) + " of " +
                             std::to_string(n) + " elements");
    }
    return Ranking::from_bottom_up(bottom_up);
}

RankInterval rank_interval(const PartialOrder& order, ElementIdx element)
{
    RankInterval interval;
    interval.min_rank = extremal_ranking(order, element, ExtremalPlacement::Lowest).rank(element);
    interval.max_rank = extremal_ranking(order, element, ExtremalPlacement::Highest).rank(element);
    return interval;
}

std::vector<RankInterval> rank_intervals(const PartialOrder& order)
{
    std::vector<RankInterval> result;
    result.reserve(order.size());
    for (ElementIdx e = 0; e < order.size(); ++e)
    {
        result.push_back(rank_interval(order, e));
    }
    return result;
}

} // namespace posetrank
