// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef STATISTICS_H
#define STATISTICS_H

#include <cstddef>
#include <string_view>

#include "gcode/Command.h"
#include "gcode/GcodeParser.h"
#include "gcode/Position.h"

namespace travel
{

/*!
 * \brief Move counts and distances of a G-code file.
 */
class Statistics
{
public:
    /*!
     * Count a command.
     * \param before The machine state before the command.
     * \param after The machine state after the command.
     */
    void add(const Command& command, const Position& before, const Position& after);

    static Statistics of(const ParsedProgram& program);

    size_t g0_count = 0;
    size_t g1_count = 0;
    size_t extrusion_count = 0; //!< Commands with a positive extrusion delta.
    size_t travel_count = 0;
    double extrusion_distance = 0.0; //!< Distance the head moved while extruding.
    double travel_distance = 0.0; //!< Distance the head moved without extruding.

    /*!
     * Write the statistics to the log.
     */
    void log(std::string_view label) const;
};

} // namespace travel

#endif // STATISTICS_H
