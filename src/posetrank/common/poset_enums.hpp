/**
 * @file poset_enums.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"

namespace posetrank
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for element indices.
 *
 * @details
 * `ElementIdx` is a type alias for `size_t` used to identify elements (nodes)
 * of a partial order. Elements are numbered 0..n-1 and the numbering is fixed
 * for the lifetime of an analysis. This alias exists for clarity in API
 * signatures and documentation, not for compile-time type safety.
 */
using ElementIdx = size_t;

/**
 * @brief Type alias for ranks.
 *
 * @details
 * Ranks are 1-based. Rank 1 is the bottom (least central) position and rank n
 * is the top (most central) position.
 */
using Rank = size_t;

/**
 * @brief An ordered pair of elements, as (lower, upper).
 */
using RelationPair = std::pair<ElementIdx, ElementIdx>;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Classification of an ordered pair of elements under a partial order.
 */
enum class Comparability
{
    LessEqual,     ///< The first element is dominated by the second.
    GreaterEqual,  ///< The first element dominates the second.
    Equal,         ///< Both indices name the same element.
    Incomparable   ///< Neither element dominates the other.
};

/**
 * @brief Direction of a greedy extremal construction.
 *
 * @details
 * Used by `extremal_ranking()` to place one element as low (`Lowest`) or as
 * high (`Highest`) as the partial order allows.
 */
enum class ExtremalPlacement
{
    Lowest,
    Highest
};

/**
 * @brief Get a printable name for a comparability value.
 */
inline const char* to_string(Comparability value) noexcept
{
    switch (value)
    {
    case Comparability::LessEqual:
        return "LessEqual";
    case Comparability::GreaterEqual:
        return "GreaterEqual";
    case Comparability::Equal:
        return "Equal";
    case Comparability::Incomparable:
        return "Incomparable";
    }
    return "Unknown";
}

} // namespace posetrank
