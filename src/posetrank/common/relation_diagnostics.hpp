/**
 * @file relation_diagnostics.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/poset_enums.hpp"

namespace posetrank
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue; the relation is still usable.
    Error     ///< Blocking issue that prevents construction of the order.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    NotSquare,      ///< A matrix row does not have n entries.
    NotReflexive,   ///< Some element is not related to itself.
    Cycle,          ///< The strict relation contains a cycle.
    NotTransitive   ///< i <= j and j <= k hold but i <= k does not.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Element indices involved in this issue (if applicable).
    /// For `NotTransitive` this is the witness triple (i, j, k).
    std::vector<ElementIdx> involved_elements;
};

// ============================================================================
// RelationDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while validating a relation.
 *
 * @details
 * `RelationDiagnostics` contains all errors and warnings detected when a
 * comparability matrix is turned into a `PartialOrder`. It is the only
 * reporting channel of the library; callers decide whether and where to log
 * its `summary()`.
 *
 * @par Error vs Warning
 * - **Errors** make construction fail with `MalformedRelationError`:
 *   NotSquare, NotReflexive, Cycle.
 * - **Warnings** are kept on the constructed order: NotTransitive. The
 *   number of recorded transitivity items is capped; `suppressed_warnings()`
 *   counts the ones that were found but not recorded.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class RelationDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the relation is usable as a partial order.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Number of warnings detected beyond the reporting cap.
     */
    size_t suppressed_warnings() const noexcept
    {
        return m_suppressed_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /**
     * @brief Get a one-line summary for logging.
     */
    std::string summary() const
    {
        std::string result = is_valid() ? "Relation valid" : "Relation invalid";
        result += " (errors=" + std::to_string(m_errors.size());
        result += ", warnings=" + std::to_string(m_warnings.size() + m_suppressed_warnings);
        result += ")";
        if (!m_errors.empty())
        {
            result += ": " + m_errors.front().message;
        }
        else if (!m_warnings.empty())
        {
            result += ": " + m_warnings.front().message;
        }
        return result;
    }

    // Allow PartialOrder to populate diagnostics
    friend class PartialOrder;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
    size_t m_suppressed_warnings = 0;
};

} // namespace posetrank
