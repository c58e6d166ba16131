// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef TESTS_FIXTURES_H
#define TESTS_FIXTURES_H

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "gcode/GcodeParser.h"
#include "gcode/Layer.h"

namespace travel
{
class UnsupportedCommandLog;

/*
 * One layer with two islands, entries at (0,0) and (10,0). The second island is reached with a single travel.
 */
extern const std::string two_islands_gcode;

/*
 * One layer with three islands printed left, right, middle: entries at (0,0), (20,0) and (10,0). Retracts around
 * the first travel, absolute extrusion.
 */
extern const std::string three_islands_gcode;

/*
 * Like three_islands_gcode, but the extruding moves carry no feed rate and relative extrusion is used.
 */
extern const std::string feedrate_gcode;

/*
 * Three layers at Z 0.2, 0.4 and 0.6, with start and end code, two islands per layer.
 */
extern const std::string three_layers_gcode;

ParsedProgram parseGcode(const std::string& gcode, UnsupportedCommandLog* unsupported_log = nullptr);

std::vector<Layer> segmentGcode(const std::string& gcode);

std::vector<std::string> splitLines(const std::string& text);

/*
 * The raw text of all extruding commands in some G-code.
 */
std::multiset<std::string> extrudingLines(const std::string& gcode);

void writeTextFile(const std::filesystem::path& path, std::string_view content);

/*
 * Write a shell script and make it executable.
 */
void writeScript(const std::filesystem::path& path, std::string_view content);

std::string readTextFile(const std::filesystem::path& path);

} // namespace travel

#endif // TESTS_FIXTURES_H
