// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher.

#ifndef GEOMETRY_POINT3D_H
#define GEOMETRY_POINT3D_H

#include <cmath>

namespace travel
{

/*
Double-precision 3D points, in the units of the G-code file.
*/
class Point3D
{
public:
    double x_, y_, z_;

    Point3D()
        : x_(0.0)
        , y_(0.0)
        , z_(0.0)
    {
    }

    Point3D(double x, double y, double z)
        : x_(x)
        , y_(y)
        , z_(z)
    {
    }

    bool operator==(const Point3D& p) const = default;

    Point3D operator-(const Point3D& other) const
    {
        return Point3D(x_ - other.x_, y_ - other.y_, z_ - other.z_);
    }

    double vSize2() const
    {
        return x_ * x_ + y_ * y_ + z_ * z_;
    }

    double vSize() const
    {
        return std::sqrt(vSize2());
    }

    //! Length of the projection on the XY plane.
    double vSizeXY() const
    {
        return std::hypot(x_, y_);
    }
};

} // namespace travel
#endif // GEOMETRY_POINT3D_H
