// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/GcodeParser.h"

#include <cctype>
#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "gcode/UnsupportedCommandLog.h"
#include "utils/OptimizerError.h"
#include "utils/string.h"

namespace travel
{

namespace
{

/*!
 * Remove ';' comments and '(...)' comments from a line.
 */
std::string stripComments(std::string_view line)
{
    std::string result;
    result.reserve(line.size());
    size_t depth = 0;
    for (const char c : line)
    {
        if (c == ';' && depth == 0)
        {
            break;
        }
        if (c == '(')
        {
            depth++;
        }
        else if (c == ')' && depth > 0)
        {
            depth--;
        }
        else if (depth == 0)
        {
            result.push_back(c);
        }
    }
    return result;
}

bool isNumberChar(const char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+';
}

bool isSpace(const char c)
{
    return c == ' ' || c == '\t';
}

/*!
 * Drop the line number word ("N123") and the checksum ("*71") that host software may add.
 */
std::string_view stripLineNumber(std::string_view body)
{
    if (const size_t star = body.find('*'); star != std::string_view::npos)
    {
        body = trim(body.substr(0, star));
    }
    if (body.size() > 1 && (body[0] == 'N' || body[0] == 'n') && std::isdigit(static_cast<unsigned char>(body[1])))
    {
        size_t pos = 1;
        while (pos < body.size() && std::isdigit(static_cast<unsigned char>(body[pos])))
        {
            pos++;
        }
        body = trim(body.substr(pos));
    }
    return body;
}

std::string_view modeName(const CommandCategory category)
{
    switch (category)
    {
    case CommandCategory::ABSOLUTE_POSITIONING:
    case CommandCategory::RELATIVE_POSITIONING:
        return "positioning";
    case CommandCategory::ABSOLUTE_EXTRUSION:
    case CommandCategory::RELATIVE_EXTRUSION:
        return "extrusion";
    default:
        return "units";
    }
}

} // namespace

GcodeParser::GcodeParser(const Dialect& dialect, UnsupportedCommandLog* unsupported_log)
    : dialect_(dialect)
    , unsupported_log_(unsupported_log)
{
}

Command GcodeParser::parseLine(std::string_view line, size_t line_nr)
{
    Command command;
    command.raw = std::string(line);
    command.line_nr = line_nr;

    const std::string content = stripComments(line);
    const std::string_view body = stripLineNumber(trim(content));
    if (body.empty())
    {
        command.kind = CommandKind::COMMENT;
        return command;
    }

    // The code is a letter followed by a number. Anything else (firmware macros, stray text) isn't G-code.
    size_t code_end = 1;
    while (code_end < body.size() && isNumberChar(body[code_end]))
    {
        code_end++;
    }
    const bool has_code = std::isalpha(static_cast<unsigned char>(body[0])) && code_end > 1;
    if (! has_code)
    {
        const size_t word_end = body.find_first_of(" \t");
        command.kind = CommandKind::UNKNOWN;
        command.code = Dialect::normalize(body.substr(0, word_end));
        if (unsupported_log_ != nullptr)
        {
            unsupported_log_->record(line_nr, command.code, command.raw, "not a G-code command");
        }
        return command;
    }

    command.code = Dialect::normalize(body.substr(0, code_end));
    const std::optional<CommandCategory> category = dialect_.categorize(command.code);
    if (! category)
    {
        command.kind = CommandKind::UNKNOWN;
        if (unsupported_log_ != nullptr)
        {
            unsupported_log_->record(line_nr, command.code, command.raw, "unknown command");
        }
        return command;
    }
    command.category = *category;

    switch (command.category)
    {
    case CommandCategory::MOVE:
    case CommandCategory::ARC:
    case CommandCategory::HOME:
    case CommandCategory::SET_POSITION:
        try
        {
            readWords(command, body.substr(code_end));
        }
        catch (const ParseError& e)
        {
            spdlog::debug("{}", e.what());
            command.kind = CommandKind::UNKNOWN;
            command.category = CommandCategory::PASSTHROUGH;
            command.x = command.y = command.z = command.e = command.f = std::nullopt;
            if (unsupported_log_ != nullptr)
            {
                unsupported_log_->record(line_nr, command.code, command.raw, e.what());
            }
            return command;
        }
        break;
    default:
        // Parameters of other commands (temperatures, messages) don't affect the position and are kept as raw text.
        break;
    }

    switch (command.category)
    {
    case CommandCategory::MOVE:
    case CommandCategory::ARC:
        if (! command.hasAxisWords())
        {
            command.kind = CommandKind::STATE_CHANGE; // Feed rate only.
        }
        else
        {
            command.kind = position_.extrusionDelta(command) > 0.0 ? CommandKind::EXTRUDE : CommandKind::TRAVEL;
        }
        break;
    case CommandCategory::HOME:
        command.kind = CommandKind::HOME;
        break;
    default:
        command.kind = CommandKind::STATE_CHANGE;
        break;
    }

    checkModeSwitch(command);
    position_.apply(command);
    return command;
}

ParsedProgram GcodeParser::parse(std::istream& input)
{
    ParsedProgram program;
    program.positions = { position_ };

    std::string line;
    size_t line_nr = 0;
    while (std::getline(input, line))
    {
        line_nr++;
        if (! line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        program.commands.push_back(parseLine(line, line_nr));
        program.positions.push_back(position_);
    }
    if (input.bad())
    {
        throw InputError(fmt::format("Reading failed after line {}", line_nr));
    }
    return program;
}

void GcodeParser::readWords(Command& command, std::string_view words) const
{
    size_t pos = 0;
    while (pos < words.size())
    {
        if (isSpace(words[pos]))
        {
            pos++;
            continue;
        }
        const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(words[pos])));
        if (! std::isalpha(static_cast<unsigned char>(letter)))
        {
            throw ParseError(command.line_nr, fmt::format("unexpected character '{}' in {}", words[pos], command.code));
        }
        pos++;
        while (pos < words.size() && isSpace(words[pos]))
        {
            pos++;
        }
        const size_t number_start = pos;
        while (pos < words.size() && isNumberChar(words[pos]))
        {
            pos++;
        }

        std::optional<double> value;
        if (pos > number_start)
        {
            const std::string number(words.substr(number_start, pos - number_start));
            char* end = nullptr;
            const double parsed = std::strtod(number.c_str(), &end);
            if (end != number.c_str() + number.size())
            {
                throw ParseError(command.line_nr, fmt::format("malformed number '{}' for {}", number, letter));
            }
            value = parsed;
        }
        else if (command.category == CommandCategory::HOME)
        {
            value = 0.0; // "G28 X Y" names the axes to home without values.
        }
        else if (letter == 'X' || letter == 'Y' || letter == 'Z' || letter == 'E' || letter == 'F')
        {
            throw ParseError(command.line_nr, fmt::format("missing value for {}", letter));
        }

        switch (letter)
        {
        case 'X':
            command.x = value;
            break;
        case 'Y':
            command.y = value;
            break;
        case 'Z':
            command.z = value;
            break;
        case 'E':
            command.e = value;
            break;
        case 'F':
            command.f = value;
            break;
        default:
            // Arc centres, radii and firmware specific parameters.
            break;
        }
    }
}

void GcodeParser::checkModeSwitch(const Command& command)
{
    bool* already_set = nullptr;
    bool switches = false;
    switch (command.category)
    {
    case CommandCategory::ABSOLUTE_POSITIONING:
    case CommandCategory::RELATIVE_POSITIONING:
        already_set = &positioning_set_;
        switches = position_.absolute_positioning != (command.category == CommandCategory::ABSOLUTE_POSITIONING);
        break;
    case CommandCategory::ABSOLUTE_EXTRUSION:
    case CommandCategory::RELATIVE_EXTRUSION:
        already_set = &extrusion_set_;
        switches = position_.absolute_extrusion != (command.category == CommandCategory::ABSOLUTE_EXTRUSION);
        break;
    case CommandCategory::UNITS_MILLIMETERS:
    case CommandCategory::UNITS_INCHES:
        already_set = &units_set_;
        switches = (position_.units == UnitsMode::INCHES) != (command.category == CommandCategory::UNITS_INCHES);
        break;
    default:
        return;
    }

    if (*already_set)
    {
        if (switches)
        {
            spdlog::warn("{} at line {} switches the {} mode after it was already set", command.code, command.line_nr, modeName(command.category));
        }
        else
        {
            spdlog::warn("{} at line {} sets the {} mode again", command.code, command.line_nr, modeName(command.category));
        }
    }
    *already_set = true;
}

} // namespace travel
