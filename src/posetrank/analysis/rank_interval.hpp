/**
 * @file rank_interval.hpp
 * @brief Rank intervals via greedy extremal linear extensions.
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/partial_order.hpp"
#include "posetrank/common/ranking.hpp"

namespace posetrank
{

/**
 * @brief The range of ranks an element attains over all linear extensions.
 */
struct RankInterval
{
    Rank min_rank{0};
    Rank max_rank{0};

    /**
     * @brief Number of distinct ranks in the interval.
     */
    size_t width() const noexcept
    {
        return max_rank - min_rank + 1;
    }

    bool contains(Rank r) const noexcept
    {
        return min_rank <= r && r <= max_rank;
    }

    bool operator==(const RankInterval& other) const noexcept
    {
        return min_rank == other.min_rank && max_rank == other.max_rank;
    }

    bool operator!=(const RankInterval& other) const noexcept
    {
        return !(*this == other);
    }
};

/**
 * @brief Build a linear extension that places one element at an extreme.
 *
 * @details
 * Runs Kahn's algorithm bottom-up with two ready queues. For `Lowest`, the
 * preferred queue holds the down-closure of `element`, so `element` is placed
 * right after the elements it must follow. For `Highest`, the preferred queue
 * holds everything outside the up-closure of `element`, so `element` is placed
 * only when nothing else can go first. The remaining elements complete the
 * ranking in ready order.
 *
 * @return A linear extension of `order` in which `element` has its minimum
 *         (`Lowest`) or maximum (`Highest`) possible rank.
 * @throw PosetError with `InvalidElementIndex` for an invalid element.
 */
Ranking extremal_ranking(const PartialOrder& order, ElementIdx element, ExtremalPlacement placement);

/**
 * @brief Minimum and maximum rank of `element` over all linear extensions.
 *
 * @details
 * Computed from the two `extremal_ranking()` witnesses; never enumerates.
 * An element above every other element gets `(n, n)`; an element
 * incomparable to everything gets `(1, n)`.
 *
 * @throw PosetError with `InvalidElementIndex` for an invalid element.
 */
RankInterval rank_interval(const PartialOrder& order, ElementIdx element);

/**
 * @brief Rank intervals of all elements, indexed by element.
 */
std::vector<RankInterval> rank_intervals(const PartialOrder& order);

} // namespace posetrank
