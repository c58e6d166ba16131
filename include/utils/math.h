// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher.

#ifndef UTILS_MATH_H
#define UTILS_MATH_H

#include <cmath>
#include <cstdint>

#include "utils/types/generic.h"

namespace travel
{

/**
 * @brief Raises an integer to a non-negative integer power.
 */
template<utils::integral T>
[[nodiscard]] constexpr T ipow(T base, unsigned exponent)
{
    T result = 1;
    for (; exponent > 0; --exponent)
    {
        result *= base;
    }
    return result;
}

/**
 * @brief Returns the quotient of the division of two unsigned integers, rounded to the nearest integer.
 *
 * @param dividend The numerator.
 * @param divisor The denominator (must not be zero).
 * @return uint64_t The result of the division rounded to the nearest integer.
 */
[[nodiscard]] inline uint64_t round_divide(const uint64_t dividend, const uint64_t divisor)
{
    return (dividend + divisor / 2) / divisor;
}

/*!
 * \brief Whether two coordinates read from G-code should be considered equal.
 *
 * G-code carries at most a handful of decimals, so anything closer than a micro-unit is the same place.
 */
[[nodiscard]] inline bool fuzzy_equal(const double a, const double b)
{
    return std::abs(a - b) < 1e-6;
}

} // namespace travel
#endif // UTILS_MATH_H
