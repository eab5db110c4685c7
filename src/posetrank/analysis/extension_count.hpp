/**
 * @file extension_count.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"

#include <boost/multiprecision/cpp_int.hpp>

namespace posetrank
{

/**
 * @brief Arbitrary precision count of linear extensions.
 *
 * @details
 * Extension counts are bounded only by n!, so any fixed-width integer would
 * overflow for moderately sized orders (21! already exceeds 2^64).
 */
using ExtensionCount = boost::multiprecision::cpp_int;

/**
 * @brief Convert a count to the nearest double (may be +inf for huge counts).
 */
inline double to_double(const ExtensionCount& count)
{
    return count.convert_to<double>();
}

/**
 * @brief Decimal representation of a count.
 */
inline std::string to_string(const ExtensionCount& count)
{
    return count.str();
}

} // namespace posetrank
