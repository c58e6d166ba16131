// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_POSITION_H
#define GCODE_POSITION_H

#include "geometry/Point3D.h"

namespace travel
{

struct Command;

enum class UnitsMode
{
    MILLIMETERS,
    INCHES,
};

/*!
 * \brief The machine state that commands read and modify.
 *
 * Tracked incrementally while parsing: each command's effect on the position only depends on the position before it.
 * The reconstructor replays emitted commands on its own Position to know where the machine actually is.
 */
struct Position
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double e = 0.0; //!< Extruder axis, as the firmware sees it (only meaningful as an absolute value in absolute extrusion mode).
    double feedrate = 0.0; //!< Modal feed rate, 0 when none has been set yet.

    bool absolute_positioning = true; //!< G90 (true) or G91 (false).
    bool absolute_extrusion = true; //!< M82 (true) or M83 (false), also set by the last G90 or G91.
    UnitsMode units = UnitsMode::MILLIMETERS;

    /*!
     * Apply the effect of a command on this position.
     * \param command The command that is executed from this position.
     */
    void apply(const Command& command);

    /*!
     * The extrusion delta the command would produce if executed from this position.
     */
    [[nodiscard]] double extrusionDelta(const Command& command) const;

    [[nodiscard]] Point3D point() const
    {
        return Point3D(x, y, z);
    }

    /*!
     * Whether both positions interpret coordinates the same way.
     */
    [[nodiscard]] bool sameModes(const Position& other) const
    {
        return absolute_positioning == other.absolute_positioning && absolute_extrusion == other.absolute_extrusion && units == other.units;
    }
};

} // namespace travel

#endif // GCODE_POSITION_H
