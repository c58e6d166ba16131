// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/Dialect.h"

#include <cctype>

#include <spdlog/spdlog.h>

namespace travel
{

Dialect Dialect::marlin()
{
    Dialect dialect;

    dialect.add("G0", CommandCategory::MOVE);
    dialect.add("G1", CommandCategory::MOVE);
    dialect.add("G2", CommandCategory::ARC);
    dialect.add("G3", CommandCategory::ARC);
    dialect.add("G28", CommandCategory::HOME);
    dialect.add("G92", CommandCategory::SET_POSITION);
    dialect.add("G90", CommandCategory::ABSOLUTE_POSITIONING);
    dialect.add("G91", CommandCategory::RELATIVE_POSITIONING);
    dialect.add("M82", CommandCategory::ABSOLUTE_EXTRUSION);
    dialect.add("M83", CommandCategory::RELATIVE_EXTRUSION);
    dialect.add("G20", CommandCategory::UNITS_INCHES);
    dialect.add("G21", CommandCategory::UNITS_MILLIMETERS);

    // Dwell, bed levelling, motors, temperatures, fans, accelerations, printer checks, pressure advance, input shaping.
    dialect.addPassthrough({ "G4",     "G29",    "G80",    "M17",    "M18",    "M73",    "M74",    "M84",    "M104",   "M105",   "M106",   "M107",
                             "M109",   "M115",   "M117",   "M140",   "M141",   "M142",   "M190",   "M191",   "M201",   "M203",   "M204",   "M205",
                             "M206",   "M220",   "M221",   "M302",   "M400",   "M486",   "M555",   "M569",   "M572",   "M593",   "M862.1", "M862.3",
                             "M862.5", "M862.6", "M900",   "M907",   "T0",     "T1",     "T2",     "T3",     "T4",     "T5",     "T6",     "T7" });
    return dialect;
}

void Dialect::add(std::string_view code, CommandCategory category)
{
    table_.insert_or_assign(normalize(code), category);
}

void Dialect::addPassthrough(const std::vector<std::string>& codes)
{
    for (const std::string& code : codes)
    {
        const std::string normalized = normalize(code);
        if (normalized.empty())
        {
            spdlog::warn("Ignoring empty command code in the passthrough list");
            continue;
        }
        if (table_.contains(normalized) && table_.at(normalized) != CommandCategory::PASSTHROUGH)
        {
            spdlog::warn("{} moves the machine and can't be treated as a passthrough command", normalized);
            continue;
        }
        table_.insert_or_assign(normalized, CommandCategory::PASSTHROUGH);
    }
}

std::optional<CommandCategory> Dialect::categorize(const std::string& code) const
{
    const auto found = table_.find(code);
    if (found == table_.end())
    {
        return std::nullopt;
    }
    return found->second;
}

std::string Dialect::normalize(std::string_view code)
{
    std::string result;
    result.reserve(code.size());
    size_t pos = 0;
    while (pos < code.size() && std::isalpha(static_cast<unsigned char>(code[pos])))
    {
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(code[pos]))));
        pos++;
    }
    // Drop leading zeros of the number, but keep a single zero for "G0".
    while (pos + 1 < code.size() && code[pos] == '0' && std::isdigit(static_cast<unsigned char>(code[pos + 1])))
    {
        pos++;
    }
    for (; pos < code.size(); pos++)
    {
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(code[pos]))));
    }
    return result;
}

} // namespace travel
