// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_ISLAND_H
#define GCODE_ISLAND_H

#include <cstddef>

#include "gcode/Position.h"

namespace travel
{

/*!
 * \brief A contiguous extruding path within a layer, which is visited as a whole.
 *
 * The commands of an island are referred to by a half-open index range into the commands of its layer. They are
 * never reordered or split.
 */
struct Island
{
    size_t begin = 0; //!< Index of the first command, in the layer.
    size_t end = 0; //!< One past the index of the last command, in the layer.
    Position entry; //!< The machine state before the first command.
    Position exit; //!< The machine state after the last command.
    size_t merged_count = 1; //!< How many islands found by the segmenter this one consists of.

    [[nodiscard]] size_t size() const
    {
        return end - begin;
    }
};

} // namespace travel

#endif // GCODE_ISLAND_H
