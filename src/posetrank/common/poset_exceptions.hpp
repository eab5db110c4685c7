/**
 * @file poset_exceptions.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"

namespace posetrank
{

/**
 * @brief Error codes for posetrank operations.
 */
enum class PosetErrorCode
{
    MalformedRelation,
    DegenerateInput,
    IntractableInput,
    InvalidElementIndex,
    InvalidState
};

/**
 * @brief Exception class for posetrank errors.
 *
 * @details
 * `PosetError` is thrown when preconditions are violated, indices are
 * invalid, or a computation cannot be completed within its configured
 * budget. Each exception carries an error code and a descriptive message.
 *
 * The subclasses below exist so callers can catch one failure kind without
 * inspecting `code()`. Errors without a dedicated subclass
 * (`InvalidElementIndex`, `InvalidState`) are thrown as `PosetError`.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class PosetError : public std::exception
{
public:
    /**
     * @brief Construct a PosetError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    PosetError(PosetErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    PosetErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    PosetErrorCode m_code;
    std::string m_message;
};

/**
 * @brief The input relation is non-square, not reflexive, or cyclic.
 *
 * @details
 * Raised while constructing a `PartialOrder`. Not recoverable locally: the
 * caller has to supply a different relation.
 */
class MalformedRelationError : public PosetError
{
public:
    explicit MalformedRelationError(std::string message)
        : PosetError(PosetErrorCode::MalformedRelation, std::move(message))
    {
    }
};

/**
 * @brief The element set is too small for the requested computation.
 *
 * @details
 * Comparable fractions and rank statistics need at least two elements.
 */
class DegenerateInputError : public PosetError
{
public:
    explicit DegenerateInputError(std::string message)
        : PosetError(PosetErrorCode::DegenerateInput, std::move(message))
    {
    }
};

/**
 * @brief The problem exceeds the configured size, step or time budget.
 *
 * @details
 * Recoverable: exact counting and rank intervals remain available to the
 * caller when full enumeration is refused or aborted.
 */
class IntractableInputError : public PosetError
{
public:
    explicit IntractableInputError(std::string message)
        : PosetError(PosetErrorCode::IntractableInput, std::move(message))
    {
    }
};

} // namespace posetrank
