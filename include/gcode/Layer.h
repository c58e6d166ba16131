// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_LAYER_H
#define GCODE_LAYER_H

#include <cstddef>
#include <vector>

#include "gcode/Command.h"
#include "gcode/Island.h"
#include "gcode/Position.h"

namespace travel
{

/*!
 * \brief The commands printed at one height, with the islands found among them.
 *
 * Everything that is not part of an island is a connector: the leading block before the first island, the blocks
 * between two islands and the trailing block after the last one.
 */
struct Layer
{
    size_t layer_nr = 0; //!< 0-based, in file order. Layer 0 also holds the start code before the first extrusion.
    double z = 0.0; //!< The height of the extruding moves.

    std::vector<Command> commands;

    /*!
     * positions[i] is the machine state before commands[i]. Holds one more element than commands: the last one is the
     * state at the end of the layer.
     */
    std::vector<Position> positions;

    std::vector<Island> islands;

    [[nodiscard]] const Position& start() const
    {
        return positions.front();
    }

    [[nodiscard]] const Position& finish() const
    {
        return positions.back();
    }

    /*!
     * Index of the first command of the connector block that precedes island \p island_idx, in the layer.
     * For island_idx == islands.size() this is the start of the trailing block.
     */
    [[nodiscard]] size_t connectorBegin(const size_t island_idx) const
    {
        return island_idx == 0 ? 0 : islands[island_idx - 1].end;
    }

    /*!
     * One past the last command of the connector block that precedes island \p island_idx.
     */
    [[nodiscard]] size_t connectorEnd(const size_t island_idx) const
    {
        return island_idx == islands.size() ? commands.size() : islands[island_idx].begin;
    }
};

} // namespace travel

#endif // GCODE_LAYER_H
