/**
 * @file ranking.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/poset_enums.hpp"

namespace posetrank
{

class PartialOrder;

/**
 * @brief A total ranking of n elements, i.e. a bijection element -> rank.
 *
 * @details
 * Ranks are 1-based: rank 1 is the bottom and rank n the top. A ranking is a
 * linear extension of a partial order when every relation i <= j (i != j)
 * satisfies rank(i) < rank(j); see `respects()`.
 *
 * @par Thread safety
 * - Value type; immutable after construction.
 */
class Ranking
{
public:
    Ranking() = default;

    /**
     * @brief Construct from a rank vector.
     * @param ranks `ranks[i]` is the 1-based rank of element i.
     * @throw PosetError with `InvalidState` if the vector is not a permutation
     *        of 1..n.
     */
    explicit Ranking(std::vector<Rank> ranks);

    /**
     * @brief Construct from the list of elements ordered from rank 1 to rank n.
     * @throw PosetError with `InvalidState` if the list is not a permutation
     *        of 0..n-1.
     */
    static Ranking from_bottom_up(const std::vector<ElementIdx>& elements);

    size_t size() const noexcept
    {
        return m_ranks.size();
    }

    /**
     * @brief Rank of an element.
     * @throw PosetError with `InvalidElementIndex` for an invalid index.
     */
    Rank rank(ElementIdx element) const;

    const std::vector<Rank>& ranks() const noexcept
    {
        return m_ranks;
    }

    /**
     * @brief Elements listed from rank 1 (bottom) to rank n (top).
     */
    std::vector<ElementIdx> bottom_up() const;

    /**
     * @brief Check whether this ranking is a linear extension of `order`.
     * @return False if sizes differ or some i < j has rank(i) > rank(j).
     */
    bool respects(const PartialOrder& order) const;

    bool operator==(const Ranking& other) const noexcept
    {
        return m_ranks == other.m_ranks;
    }

    bool operator!=(const Ranking& other) const noexcept
    {
        return m_ranks != other.m_ranks;
    }

    bool operator<(const Ranking& other) const noexcept
    {
        return m_ranks < other.m_ranks;
    }

    /**
     * @brief Printable form, elements bottom-up, e.g. "[0, 2, 1]".
     */
    std::string to_string() const;

private:
    std::vector<Rank> m_ranks;
};

} // namespace posetrank
