// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_RECONSTRUCTOR_H
#define GCODE_RECONSTRUCTOR_H

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include "gcode/Command.h"
#include "gcode/Layer.h"
#include "gcode/Position.h"
#include "Statistics.h"

namespace travel
{

/*!
 * \brief Writes layers back as G-code, visiting their islands in a new order.
 *
 * The commands of each island are written unchanged. The connector blocks stay at their positions in the sequence,
 * but the travel moves in them are replaced by a single travel to the island that is now visited next.
 *
 * The machine state is tracked while writing. Where the state differs from what the next block of commands expects
 * (extruder position, feed rate, head position) the reconstructor inserts commands to restore it, so that the
 * original commands do exactly what they did before.
 */
class Reconstructor
{
public:
    explicit Reconstructor(std::ostream& out);

    /*!
     * Write a comment stating where the file came from.
     */
    void writeHeader(std::string_view source_name);

    /*!
     * Write a layer.
     * \param layer The layer with its (merged) islands.
     * \param order The indices of the islands in visiting order. Without an order, or if the layer can't be reordered
     * safely, the layer is written as it was.
     */
    void emit(const Layer& layer, const std::vector<size_t>& order);

    /*!
     * Whether the islands of a layer can be visited in any order. They can't when the way coordinates are interpreted
     * changes somewhere between the first and the last island (positioning, extrusion or units mode, a G92 on the
     * axes), or the machine is homed in between.
     */
    [[nodiscard]] static bool canReorder(const Layer& layer);

    [[nodiscard]] const Position& position() const
    {
        return position_;
    }

    [[nodiscard]] size_t addedCommandCount() const
    {
        return added_commands_;
    }

    [[nodiscard]] size_t droppedTravelCount() const
    {
        return dropped_travels_;
    }

    //! Statistics of everything written so far.
    [[nodiscard]] const Statistics& statistics() const
    {
        return statistics_;
    }

private:
    void emitVerbatim(const Layer& layer);

    /*!
     * Write the connector block before the island at visiting position \p position_idx, with its travels replaced by
     * a travel to \p target.
     */
    void emitConnector(const Layer& layer, size_t position_idx, const Position& target);

    void emitRange(const Layer& layer, size_t begin, size_t end);

    /*!
     * Bring the machine back in the state a block of commands expects.
     * \param expected The state before the block in the original file.
     * \param first_motion The first move of the block, if any.
     * \param restore_xy Whether the head needs to be at the expected position.
     */
    void restoreState(const Position& expected, const Command* first_motion, bool restore_xy);

    /*!
     * Travel to a position in the plane.
     * \param z The Z word to add, as it would be written in the current positioning mode.
     */
    void travelTo(double x, double y, std::optional<double> z, std::optional<double> f);

    void emitLine(const Command& command);

    void emitAdded(Command&& command);

    std::ostream& out_;
    Position position_;
    size_t added_commands_ = 0;
    size_t dropped_travels_ = 0;
    Statistics statistics_;
};

} // namespace travel

#endif // GCODE_RECONSTRUCTOR_H
