// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_GCODE_PARSER_H
#define GCODE_GCODE_PARSER_H

#include <istream>
#include <string_view>
#include <vector>

#include "gcode/Command.h"
#include "gcode/Dialect.h"
#include "gcode/Position.h"

namespace travel
{

class UnsupportedCommandLog;

/*!
 * The commands of a whole file, together with the machine position around each of them.
 */
struct ParsedProgram
{
    std::vector<Command> commands;

    /*!
     * positions[i] is the machine state right before commands[i] executes, and positions[i + 1] right after.
     * Always holds one more element than commands.
     */
    std::vector<Position> positions{ Position() };
};

/*!
 * \brief Turns lines of G-code into typed commands, while keeping track of the machine position.
 *
 * Lines that can't be classified are kept as unknown passthrough commands and reported to the unsupported-command
 * log, if one was given. Parsing never fails on a single line.
 */
class GcodeParser
{
public:
    /*!
     * \param dialect The table of recognised codes. Must outlive the parser.
     * \param unsupported_log Where to report unrecognised lines, or nullptr to not report them.
     */
    GcodeParser(const Dialect& dialect, UnsupportedCommandLog* unsupported_log);

    /*!
     * Parse one line and advance the machine position.
     * \param line The line, without line ending.
     * \param line_nr The 1-based line number, used for reporting.
     */
    Command parseLine(std::string_view line, size_t line_nr);

    /*!
     * Parse a whole stream, starting from the current position.
     */
    ParsedProgram parse(std::istream& input);

    [[nodiscard]] const Position& position() const
    {
        return position_;
    }

private:
    /*!
     * Read the words of a command into its fields.
     * \throws ParseError when a word carries something that isn't a number.
     */
    void readWords(Command& command, std::string_view words) const;

    /*!
     * Warn about a mode being switched halfway through a file, as that's almost never intended.
     */
    void checkModeSwitch(const Command& command);

    const Dialect& dialect_;
    UnsupportedCommandLog* unsupported_log_;
    Position position_;

    bool positioning_set_ = false;
    bool extrusion_set_ = false;
    bool units_set_ = false;
};

} // namespace travel

#endif // GCODE_GCODE_PARSER_H
