/**
 * @file linear_extension_enumerator.cpp
 */
#include "posetrank/analysis/linear_extension_enumerator.hpp"
#include "posetrank/common/element_set.hpp"
#include "posetrank/common/poset_exceptions.hpp"

namespace posetrank
{

// ============================================================================
// ExtensionPlan
// ============================================================================

/**
 * @brief The part of a partial order the recursion needs, detached from it.
 */
struct ExtensionPlan
{
    size_t element_count = 0;

    /// above[i] = elements strictly dominating i.
    std::vector<ElementSet> above;

    /**
     * @brief Elements of `remaining` not strictly dominated by another
     *        element of `remaining`, in increasing index order.
     */
    std::vector<ElementIdx> maximal_elements(const ElementSet& remaining) const
    {
        std::vector<ElementIdx> result;
        remaining.for_each([&](ElementIdx e) {
            if (!above[e].intersects(remaining))
            {
                result.push_back(e);
            }
        });
        return result;
    }
};

namespace
{

using CountMemo = std::unordered_map<ElementSet, ExtensionCount, ElementSetHash>;

std::shared_ptr<const ExtensionPlan> make_plan(const PartialOrder& order)
{
    auto plan = std::make_shared<ExtensionPlan>();
    plan->element_count = order.size();
    plan->above.reserve(order.size());
    for (ElementIdx i = 0; i < order.size(); ++i)
    {
        plan->above.push_back(order.strictly_above(i));
    }
    return plan;
}

ExtensionCount count_remaining(const ExtensionPlan& plan,
                               const ElementSet& remaining,
                               CountMemo& memo,
                               EnumerationBudget& budget)
{
    if (remaining.count() <= 1)
    {
        return 1;
    }

    auto it = memo.find(remaining);
    if (it != memo.end())
    {
        return it->second;
    }

    budget.charge();

    ExtensionCount total = 0;
    ElementSet rest = remaining;
    for (ElementIdx e : plan.maximal_elements(remaining))
    {
        // e takes the highest free rank; count the extensions of the rest
        rest.erase(e);
        total += count_remaining(plan, rest, memo, budget);
        rest.insert(e);
    }

    memo.emplace(remaining, total);
    return total;
}

} // namespace

// ============================================================================
// ExtensionCursor
// ============================================================================

/**
 * @brief Explicit-stack depth-first traversal producing one ranking per step.
 */
class ExtensionCursor
{
public:
    ExtensionCursor(std::shared_ptr<const ExtensionPlan> plan,
                    const EnumeratorConfig& config,
                    StopFlag stop_flag)
        : m_plan(std::move(plan))
        , m_budget(config, std::move(stop_flag), "Linear extension enumeration")
        , m_pending_empty(m_plan->element_count == 0)
    {
        if (m_plan->element_count > 0)
        {
            m_frames.push_back(make_frame(ElementSet::full(m_plan->element_count)));
        }
    }

    /**
     * @brief Produce the next ranking into `current()`.
     * @return False once every linear extension has been produced.
     */
    bool advance()
    {
        // An interrupted traversal cannot resume; rethrow the exhaustion
        if (m_budget.exhausted())
        {
            m_budget.charge();
        }

        if (m_pending_empty)
        {
            // The empty order has exactly one (empty) extension
            m_pending_empty = false;
            m_current = Ranking();
            return true;
        }

        while (!m_frames.empty())
        {
            Frame& frame = m_frames.back();
            if (frame.next >= frame.candidates.size())
            {
                m_frames.pop_back();
                if (!m_path.empty())
                {
                    m_path.pop_back();
                }
                continue;
            }

            ElementIdx chosen = frame.candidates[frame.next++];
            ElementSet rest = frame.remaining;
            rest.erase(chosen);

            if (rest.empty())
            {
                m_path.push_back(chosen);
                emit();
                m_path.pop_back();
                return true;
            }

            Frame child = make_frame(std::move(rest));
            m_path.push_back(chosen);
            m_frames.push_back(std::move(child));
        }
        return false;
    }

    const Ranking& current() const noexcept
    {
        return m_current;
    }

private:
    struct Frame
    {
        ElementSet remaining;
        std::vector<ElementIdx> candidates;
        size_t next = 0;
    };

    Frame make_frame(ElementSet remaining)
    {
        m_budget.charge();
        Frame frame;
        frame.candidates = m_plan->maximal_elements(remaining);
        frame.remaining = std::move(remaining);
        return frame;
    }

    /// m_path[d] received rank n - d.
    void emit()
    {
        const size_t n = m_plan->element_count;
        std::vector<Rank> ranks(n, 0);
        for (size_t d = 0; d < m_path.size(); ++d)
        {
            ranks[m_path[d]] = n - d;
        }
        m_current = Ranking(std::move(ranks));
    }

    std::shared_ptr<const ExtensionPlan> m_plan;
    EnumerationBudget m_budget;
    bool m_pending_empty;
    std::vector<Frame> m_frames;
    std::vector<ElementIdx> m_path;
    Ranking m_current;
};

// ============================================================================
// ExtensionSequence
// ============================================================================

ExtensionSequence::iterator::iterator(std::shared_ptr<ExtensionCursor> cursor)
    : m_cursor(std::move(cursor))
{
}

ExtensionSequence::iterator::reference ExtensionSequence::iterator::operator*() const
{
    return m_cursor->current();
}

ExtensionSequence::iterator::pointer ExtensionSequence::iterator::operator->() const
{
    return &m_cursor->current();
}

ExtensionSequence::iterator& ExtensionSequence::iterator::operator++()
{
    if (!m_cursor->advance())
    {
        m_cursor.reset();
    }
    return *this;
}

ExtensionSequence::ExtensionSequence(std::shared_ptr<const ExtensionPlan> plan,
                                     EnumeratorConfig config,
                                     StopFlag stop_flag)
    : m_plan(std::move(plan))
    , m_config(config)
    , m_stop_flag(std::move(stop_flag))
{
}

ExtensionSequence::iterator ExtensionSequence::begin() const
{
    auto cursor = std::make_shared<ExtensionCursor>(m_plan, m_config, m_stop_flag);
    if (!cursor->advance())
    {
        return end();
    }
    return iterator(std::move(cursor));
}

size_t ExtensionSequence::element_count() const noexcept
{
    return m_plan->element_count;
}

// ============================================================================
// LinearExtensionEnumerator
// ============================================================================

LinearExtensionEnumerator::LinearExtensionEnumerator(EnumeratorConfig config)
    : m_config(config)
    , m_stop_flag(std::make_shared<std::atomic<bool>>(false))
{
}

ExtensionCount LinearExtensionEnumerator::count(const PartialOrder& order) const
{
    auto plan = make_plan(order);
    EnumerationBudget budget(m_config, m_stop_flag, "Linear extension count");
    CountMemo memo;
    return count_remaining(*plan, ElementSet::full(order.size()), memo, budget);
}

ExtensionSequence LinearExtensionEnumerator::enumerate(const PartialOrder& order) const
{
    if (order.size() > m_config.max_enumeration_size)
    {
        throw IntractableInputError(
            "Full enumeration of " + std::to_string(order.size()) +
            " elements exceeds the limit of " + std::to_string(m_config.max_enumeration_size) +
            "; use count_linear_extensions() or rank_interval() instead");
    }
    return ExtensionSequence(make_plan(order), m_config, m_stop_flag);
}

void LinearExtensionEnumerator::request_stop() noexcept
{
    m_stop_flag->store(true);
}

bool LinearExtensionEnumerator::stop_requested() const noexcept
{
    return m_stop_flag->load();
}

// ============================================================================
// Free functions
// ============================================================================

ExtensionCount count_linear_extensions(const PartialOrder& order, const EnumeratorConfig& config)
{
    return LinearExtensionEnumerator(config).count(order);
}

ExtensionSequence enumerate_linear_extensions(const PartialOrder& order,
                                              const EnumeratorConfig& config)
{
    return LinearExtensionEnumerator(config).enumerate(order);
}

} // namespace posetrank
