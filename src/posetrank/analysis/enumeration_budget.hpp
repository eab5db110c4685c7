/**
 * @file enumeration_budget.hpp
 * @brief EnumeratorConfig and the per-call EnumerationBudget.
 */
#pragma once
#include "posetrank/common/common.hpp"

namespace posetrank
{

/**
 * @brief Configuration for counting and enumerating linear extensions.
 */
struct EnumeratorConfig
{
    /**
     * @brief Largest n for which full enumeration is attempted.
     * @details `enumerate()` throws `IntractableInputError` above this size.
     *          Counting is not subject to this limit.
     */
    size_t max_enumeration_size{12};

    /**
     * @brief Maximum number of recursion steps per call.
     * @details 0 means unlimited.
     */
    uint64_t step_budget{0};

    /**
     * @brief Maximum wall-clock time per call.
     * @details 0 means unlimited.
     */
    std::chrono::nanoseconds time_budget{0};
};

/**
 * @brief Shared cooperative stop flag.
 */
using StopFlag = std::shared_ptr<std::atomic<bool>>;

/**
 * @brief Step, time and stop-request accounting for one computation.
 *
 * @details
 * A budget is created at the start of each count or traversal and charged
 * once per expanded recursion state. When any limit is exceeded, `charge()`
 * throws `IntractableInputError`, which unwinds the computation and releases
 * its memoised state. Exhaustion is permanent: every later `charge()` throws
 * the same error.
 *
 * @par Thread safety
 * - Not synchronized; owned by a single computation.
 * - The stop flag may be set concurrently from any thread.
 */
class EnumerationBudget
{
public:
    /**
     * @brief Start a budget.
     * @param config Limits to enforce.
     * @param stop_flag Optional stop flag; may be null.
     * @param operation Name used in error messages (e.g. "count").
     */
    EnumerationBudget(const EnumeratorConfig& config, StopFlag stop_flag, std::string operation);

    /**
     * @brief Account for one step.
     * @throw IntractableInputError if the step budget, time budget or a stop
     *        request ends the computation.
     */
    void charge();

    uint64_t steps_taken() const noexcept
    {
        return m_steps;
    }

    bool exhausted() const noexcept
    {
        return !m_failure.empty();
    }

private:
    /// Time is sampled once every this many steps.
    static constexpr uint64_t time_check_interval = 256;

    /// Record the failure and throw it.
    void fail(std::string message);

    uint64_t m_step_budget;
    std::chrono::nanoseconds m_time_budget;
    std::chrono::steady_clock::time_point m_start;
    StopFlag m_stop_flag;
    std::string m_operation;
    uint64_t m_steps = 0;
    std::string m_failure;
};

} // namespace posetrank
