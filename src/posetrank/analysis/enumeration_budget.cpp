/**
 * @file enumeration_budget.cpp
 */
#include "posetrank/analysis/enumeration_budget.hpp"
#include "posetrank/common/poset_exceptions.hpp"

namespace posetrank
{

EnumerationBudget::EnumerationBudget(const EnumeratorConfig& config,
                                     StopFlag stop_flag,
                                     std::string operation)
    : m_step_budget(config.step_budget)
    , m_time_budget(config.time_budget)
    , m_start(std::chrono::steady_clock::now())
    , m_stop_flag(std::move(stop_flag))
    , m_operation(std::move(operation))
{
}

void EnumerationBudget::charge()
{
    if (!m_failure.empty())
    {
        throw IntractableInputError(m_failure);
    }

    ++m_steps;

    if (m_stop_flag && m_stop_flag->load())
    {
        fail(m_operation + " stopped by request after " + std::to_string(m_steps) + " steps");
    }

    if (m_step_budget != 0 && m_steps > m_step_budget)
    {
        fail(m_operation + " exceeded step budget of " + std::to_string(m_step_budget) +
             " steps");
    }

    if (m_time_budget.count() != 0 && m_steps % time_check_interval == 0)
    {
        auto elapsed = std::chrono::steady_clock::now() - m_start;
        if (elapsed > m_time_budget)
        {
            auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
            fail(m_operation + " exceeded time budget after " +
                 std::to_string(elapsed_ms.count()) + " ms and " + std::to_string(m_steps) +
                 " steps");
        }
    }
}

void EnumerationBudget::fail(std::string message)
{
    m_failure = std::move(message);
    throw IntractableInputError(m_failure);
}

} // namespace posetrank
