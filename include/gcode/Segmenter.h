// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_SEGMENTER_H
#define GCODE_SEGMENTER_H

#include <vector>

#include "gcode/GcodeParser.h"
#include "gcode/Layer.h"

namespace travel
{

/*!
 * \brief Splits a parsed program into layers and each layer into islands.
 *
 * A new layer starts with the first extruding move at a height that differs from the height of the current layer.
 * The layer boundary is placed right after the last extruding command of the previous layer, so the retractions, Z
 * hops and travels leading up to a layer belong to that layer.
 */
class Segmenter
{
public:
    /*!
     * Split a whole program into layers.
     * \param program The parsed program. Its commands are moved into the layers.
     * \return The layers, in file order, with their islands filled in.
     */
    static std::vector<Layer> segment(ParsedProgram&& program);

    /*!
     * Find the islands of a layer whose commands and positions are filled in.
     *
     * An island opens at an extruding command and is closed by the first non-extruding move or home command that
     * follows. It ends at its last extruding command: whatever comes after that is part of the next connector.
     */
    static std::vector<Island> findIslands(const Layer& layer);
};

} // namespace travel

#endif // GCODE_SEGMENTER_H
