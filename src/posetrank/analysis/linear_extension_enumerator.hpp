/**
 * @file linear_extension_enumerator.hpp
 * @brief Counting and lazy enumeration of linear extensions.
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/partial_order.hpp"
#include "posetrank/common/ranking.hpp"
#include "posetrank/analysis/enumeration_budget.hpp"
#include "posetrank/analysis/extension_count.hpp"

#include <iterator>

namespace posetrank
{

// Defined in linear_extension_enumerator.cpp
struct ExtensionPlan;
class ExtensionCursor;

/**
 * @brief A lazy, finite, restartable sequence of linear extensions.
 *
 * @details
 * Produced by `LinearExtensionEnumerator::enumerate()`. Each call to
 * `begin()` starts a fresh depth-first traversal that assigns ranks from the
 * top down: at every level, one of the currently maximal remaining elements
 * receives the highest unassigned rank. A ranking is produced per iterator
 * increment, so callers may stop pulling at any point; the traversal state
 * is owned by the iterator and released with it.
 *
 * The sequence copies what it needs from the partial order and may outlive
 * it. The order in which rankings are produced is unspecified.
 *
 * @par Budget
 * Each traversal charges its own `EnumerationBudget`. An increment that
 * exhausts the budget, or observes a stop request, throws
 * `IntractableInputError`.
 *
 * @par Thread safety
 * - The sequence itself is immutable and may be shared.
 * - Iterators are not synchronized; use one iterator per thread.
 */
class ExtensionSequence
{
public:
    /**
     * @brief Single-pass input iterator over rankings.
     * @note Copies of an iterator share the same traversal.
     */
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Ranking;
        using difference_type = std::ptrdiff_t;
        using pointer = const Ranking*;
        using reference = const Ranking&;

        iterator() = default;

        reference operator*() const;
        pointer operator->() const;

        /**
         * @brief Advance to the next ranking.
         * @throw IntractableInputError if the budget is exhausted.
         */
        iterator& operator++();

        bool operator==(const iterator& other) const noexcept
        {
            return m_cursor == other.m_cursor;
        }

        bool operator!=(const iterator& other) const noexcept
        {
            return m_cursor != other.m_cursor;
        }

    private:
        friend class ExtensionSequence;
        explicit iterator(std::shared_ptr<ExtensionCursor> cursor);

        /// Null for the end iterator and for exhausted traversals.
        std::shared_ptr<ExtensionCursor> m_cursor;
    };

    /**
     * @brief Start a new traversal.
     * @throw IntractableInputError if the budget is exhausted before the
     *        first ranking is produced.
     */
    iterator begin() const;

    iterator end() const
    {
        return iterator();
    }

    /**
     * @brief Number of elements in each produced ranking.
     */
    size_t element_count() const noexcept;

private:
    friend class LinearExtensionEnumerator;
    ExtensionSequence(std::shared_ptr<const ExtensionPlan> plan,
                      EnumeratorConfig config,
                      StopFlag stop_flag);

    std::shared_ptr<const ExtensionPlan> m_plan;
    EnumeratorConfig m_config;
    StopFlag m_stop_flag;
};

/**
 * @brief Counts and enumerates the linear extensions of a partial order.
 *
 * @details
 * Both operations use the same decomposition: an element is maximal in a
 * remaining set if no other remaining element strictly dominates it, and the
 * extensions of a set are obtained by giving one maximal element the highest
 * free rank and recursing on the rest.
 *
 * - `count()` memoises the number of extensions per remaining subset, keyed
 *   by `ElementSet`, so each order ideal reachable from the full set is
 *   solved once. The memo table is local to one call.
 * - `enumerate()` walks the same recursion lazily; see `ExtensionSequence`.
 *
 * @par Cancellation
 * `request_stop()` sets a flag shared with every computation started from
 * this enumerator (and from its copies). Running and future computations
 * throw `IntractableInputError` at their next step. The flag is sticky.
 *
 * @par Thread safety
 * - `count()` and `enumerate()` are const and may run concurrently.
 * - `request_stop()` may be called from any thread.
 */
class LinearExtensionEnumerator
{
public:
    explicit LinearExtensionEnumerator(EnumeratorConfig config = {});

    const EnumeratorConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Exact number of linear extensions.
     * @return 1 for the empty order.
     * @throw IntractableInputError if the step or time budget is exhausted
     *        or a stop was requested.
     */
    ExtensionCount count(const PartialOrder& order) const;

    /**
     * @brief Lazy sequence of all linear extensions.
     * @throw IntractableInputError if `order.size()` exceeds
     *        `config().max_enumeration_size`.
     */
    ExtensionSequence enumerate(const PartialOrder& order) const;

    /**
     * @brief Request cooperative cancellation.
     */
    void request_stop() noexcept;

    bool stop_requested() const noexcept;

private:
    EnumeratorConfig m_config;
    StopFlag m_stop_flag;
};

/**
 * @brief Count linear extensions with a one-off enumerator.
 */
ExtensionCount count_linear_extensions(const PartialOrder& order, const EnumeratorConfig& config = {});

/**
 * @brief Enumerate linear extensions with a one-off enumerator.
 */
ExtensionSequence enumerate_linear_extensions(const PartialOrder& order,
                                              const EnumeratorConfig& config = {});

} // namespace posetrank
