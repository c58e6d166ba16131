// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GEOMETRY_POINT2LL_H
#define GEOMETRY_POINT2LL_H

/**
The integer point class is used for coordinates that have been scaled to the integer domain of the route solver.
*/
#define INLINE static inline

#include <cmath>
#include <cstdint>

#include "utils/types/generic.h"

namespace travel
{

using coord_t = int64_t;

struct Point2LL
{
    coord_t X = 0;
    coord_t Y = 0;

    bool operator==(const Point2LL& other) const = default;
};

INLINE Point2LL operator-(const Point2LL& p0, const Point2LL& p1)
{
    return { p0.X - p1.X, p0.Y - p1.Y };
}

/*!
 * Scale a point in machine coordinates to the integer domain.
 */
template<utils::floating_point T>
INLINE Point2LL scaled(const T x, const T y, const coord_t factor)
{
    return { std::llround(x * static_cast<T>(factor)), std::llround(y * static_cast<T>(factor)) };
}

INLINE double vSize2f(const Point2LL& p0)
{
    return static_cast<double>(p0.X) * static_cast<double>(p0.X) + static_cast<double>(p0.Y) * static_cast<double>(p0.Y);
}

/*!
 * Length rounded to the nearest integer, like the EUC_2D distance function of TSPLIB.
 */
INLINE coord_t vSize(const Point2LL& p0)
{
    return std::llrint(std::sqrt(vSize2f(p0)));
}

} // namespace travel

#endif // GEOMETRY_POINT2LL_H
