/**
 * @file ranking.cpp
 */
#include "posetrank/common/ranking.hpp"
#include "posetrank/common/partial_order.hpp"
#include "posetrank/common/poset_exceptions.hpp"

namespace posetrank
{

Ranking::Ranking(std::vector<Rank> ranks)
    : m_ranks(std::move(ranks))
{
    const size_t n = m_ranks.size();
    std::vector<bool> seen(n + 1, false);
    for (size_t i = 0; i < n; ++i)
    {
        Rank r = m_ranks[i];
        if (r < 1 || r > n || seen[r])
        {
            throw PosetError(
                PosetErrorCode::InvalidState,
                "Rank vector is not a permutation of 1.." + std::to_string(n) +
                    " (element " + std::to_string(i) + " has rank " + std::to_string(r) + ")");
        }
        seen[r] = true;
    }
}

Ranking Ranking::from_bottom_up(const std::vector<ElementIdx>& elements)
{
    const size_t n = elements.size();
    std::vector<Rank> ranks(n, 0);
    for (size_t pos = 0; pos < n; ++pos)
    {
        ElementIdx e = elements[pos];
        if (e >= n || ranks[e] != 0)
        {
            throw PosetError(
                PosetErrorCode::InvalidState,
                "Element list is not a permutation of 0.." + std::to_string(n == 0 ? 0 : n - 1));
        }
        ranks[e] = pos + 1;
    }
    return Ranking(std::move(ranks));
}

Rank Ranking::rank(ElementIdx element) const
{
    if (element >= m_ranks.size())
    {
        throw PosetError(
            PosetErrorCode::InvalidElementIndex,
            "Element index " + std::to_string(element) + " does not exist in ranking of size " +
                std::to_string(m_ranks.size()));
    }
    return m_ranks[element];
}

std::vector<ElementIdx> Ranking::bottom_up() const
{
    std::vector<ElementIdx> result(m_ranks.size());
    for (size_t i = 0; i < m_ranks.size(); ++i)
    {
        result[m_ranks[i] - 1] = i;
    }
    return result;
}

bool Ranking::respects(const PartialOrder& order) const
{
    if (order.size() != m_ranks.size())
    {
        return false;
    }
    for (size_t i = 0; i < m_ranks.size(); ++i)
    {
        bool ok = true;
        order.strictly_above(i).for_each([&](ElementIdx j) {
            if (m_ranks[i] > m_ranks[j])
            {
                ok = false;
            }
        });
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

std::string Ranking::to_string() const
{
    std::string result = "[";
    std::vector<ElementIdx> elements = bottom_up();
    for (size_t k = 0; k < elements.size(); ++k)
    {
        if (k > 0)
        {
            result += ", ";
        }
        result += std::to_string(elements[k]);
    }
    result += "]";
    return result;
}

} // namespace posetrank
