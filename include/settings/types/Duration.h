// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef DURATION_H
#define DURATION_H

#include <chrono>
#include <cmath>

namespace travel
{

/*
 * \brief Represents a duration in seconds.
 *
 * This is a facade. It behaves like a double, only it can't be negative.
 */
struct Duration
{
    /*
     * \brief Default constructor setting the duration to 0.
     */
    constexpr Duration()
        : value_(0)
    {
    }

    /*
     * \brief Casts a double to a Duration instance.
     */
    constexpr Duration(double value)
        : value_(value > 0.0 ? value : 0.0)
    {
    }

    /*
     * \brief Casts the Duration instance to a double.
     */
    constexpr operator double() const
    {
        return value_;
    }

    /*
     * \brief The duration in whole milliseconds, rounded up so that a short but non-zero duration doesn't become 0.
     */
    std::chrono::milliseconds toMilliseconds() const
    {
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::ceil(value_ * 1000.0)));
    }

    /*
     * \brief The actual duration, as a double.
     */
    double value_ = 0;
};

} // namespace travel

#endif // DURATION_H
