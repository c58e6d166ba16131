// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_COMMAND_H
#define GCODE_COMMAND_H

#include <cstddef>
#include <optional>
#include <string>

namespace travel
{

/*!
 * What a command does to the machine, as far as the optimizer cares.
 */
enum class CommandKind
{
    EXTRUDE, //!< A move with a positive extrusion delta.
    TRAVEL, //!< A move (or retraction) without a positive extrusion delta.
    HOME, //!< G28.
    STATE_CHANGE, //!< A recognised command that doesn't move the head: modes, temperatures, fans, feed rate only moves.
    COMMENT, //!< Blank lines and comment-only lines.
    UNKNOWN, //!< Anything the dialect doesn't recognise. Passed through unchanged.
};

/*!
 * The category of a G-code, taken from the dialect table. Decides how a command affects the machine position.
 */
enum class CommandCategory
{
    MOVE, //!< G0, G1.
    ARC, //!< G2, G3. Only the end point matters for the position.
    HOME,
    SET_POSITION, //!< G92.
    ABSOLUTE_POSITIONING,
    RELATIVE_POSITIONING,
    ABSOLUTE_EXTRUSION,
    RELATIVE_EXTRUSION,
    UNITS_MILLIMETERS,
    UNITS_INCHES,
    PASSTHROUGH, //!< Known, but without effect on the position.
};

/*!
 * One parsed line of G-code.
 *
 * The raw text is kept so that unmodified commands can be written back byte for byte.
 */
struct Command
{
    CommandKind kind = CommandKind::COMMENT;
    CommandCategory category = CommandCategory::PASSTHROUGH;
    std::string code; //!< Normalised code, e.g. "G1" for "G01". Empty for comments and unknown lines.
    std::string raw; //!< The line as it appeared in the input, without the line ending.
    size_t line_nr = 0; //!< 1-based line number in the input.

    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> z;
    std::optional<double> e;
    std::optional<double> f;

    [[nodiscard]] bool isMove() const
    {
        return category == CommandCategory::MOVE || category == CommandCategory::ARC;
    }

    [[nodiscard]] bool hasXY() const
    {
        return x.has_value() || y.has_value();
    }

    [[nodiscard]] bool hasAxisWords() const
    {
        return x.has_value() || y.has_value() || z.has_value() || e.has_value();
    }

    /*!
     * A non-extruding move in the plane.
     */
    [[nodiscard]] bool isPlanarTravel() const
    {
        return kind == CommandKind::TRAVEL && isMove() && hasXY();
    }

    /*!
     * A travel that only moves the head in the plane (and maybe Z), which the reconstructor is free to replace.
     *
     * Moves that also carry an E word (wipes, retract-while-moving) change the extruder state and can't simply be
     * dropped.
     */
    [[nodiscard]] bool isReplaceableTravel() const
    {
        return isPlanarTravel() && ! e.has_value();
    }

    /*!
     * Whether this command changes how following commands are interpreted.
     */
    [[nodiscard]] bool changesMode() const
    {
        switch (category)
        {
        case CommandCategory::ABSOLUTE_POSITIONING:
        case CommandCategory::RELATIVE_POSITIONING:
        case CommandCategory::ABSOLUTE_EXTRUSION:
        case CommandCategory::RELATIVE_EXTRUSION:
        case CommandCategory::UNITS_MILLIMETERS:
        case CommandCategory::UNITS_INCHES:
            return true;
        case CommandCategory::SET_POSITION:
            return x.has_value() || y.has_value() || z.has_value() || ! e.has_value(); // A bare G92 zeroes every axis.
        default:
            return false;
        }
    }
};

} // namespace travel

#endif // GCODE_COMMAND_H
