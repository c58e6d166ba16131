// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "Fixtures.h"

#include <fstream>
#include <iterator>
#include <sstream>

#include <gtest/gtest.h>

#include "gcode/Dialect.h"
#include "gcode/Segmenter.h"

namespace travel
{

const std::string two_islands_gcode = "G90\n"
                                      "M82\n"
                                      "G1 Z0.2 F3000\n"
                                      "G0 X0 Y0\n"
                                      "G1 X5 Y0 E1 F1200\n"
                                      "G1 X5 Y5 E2\n"
                                      "G0 X10 Y0\n"
                                      "G1 X15 Y0 E3\n"
                                      "G1 X15 Y5 E4\n";

const std::string three_islands_gcode = "G90\n"
                                        "M82\n"
                                        "G1 Z0.2 F3000\n"
                                        "G0 X0 Y0\n"
                                        "G1 X1 Y0 E1 F1200\n"
                                        "G1 E0.5 F2400\n"
                                        "G0 X20 Y0 F6000\n"
                                        "G1 E1 F2400\n"
                                        "G1 X21 Y0 E2 F1200\n"
                                        "G0 X10 Y0 F6000\n"
                                        "G1 X11 Y0 E3 F1200\n";

const std::string feedrate_gcode = "G90\n"
                                   "M83\n"
                                   "G1 Z0.2 F1500\n"
                                   "G0 X0 Y0\n"
                                   "G1 X1 Y0 E0.1\n"
                                   "G0 X20 Y0 F9000\n"
                                   "G1 F1200\n"
                                   "G1 X21 Y0 E0.1\n"
                                   "G0 X10 Y0 F9000\n"
                                   "G1 X11 Y0 E0.1\n";

const std::string three_layers_gcode = ";FLAVOR:Marlin\n"
                                       "M104 S200\n"
                                       "G28\n"
                                       "G90\n"
                                       "M82\n"
                                       "G92 E0\n"
                                       "G1 Z0.2 F3000\n"
                                       "G0 X0 Y0\n"
                                       ";LAYER:0\n"
                                       "G1 X5 Y0 E1 F1200\n"
                                       "G0 X20 Y0 F6000\n"
                                       "G1 X25 Y0 E2 F1200\n"
                                       "G0 X10 Y0 F6000\n"
                                       "G1 X15 Y0 E3 F1200\n"
                                       "G1 E2.5 F2400\n"
                                       ";LAYER:1\n"
                                       "G1 Z0.4 F3000\n"
                                       "G0 X0 Y5 F6000\n"
                                       "G1 E3 F2400\n"
                                       "G1 X5 Y5 E4 F1200\n"
                                       "G0 X20 Y5 F6000\n"
                                       "G1 X25 Y5 E5 F1200\n"
                                       "G1 E4.5 F2400\n"
                                       ";LAYER:2\n"
                                       "G1 Z0.6 F3000\n"
                                       "G0 X0 Y10 F6000\n"
                                       "G1 E5 F2400\n"
                                       "G1 X5 Y10 E6 F1200\n"
                                       "M107\n"
                                       "G28 X0\n"
                                       "M104 S0\n"
                                       "M84\n";

ParsedProgram parseGcode(const std::string& gcode, UnsupportedCommandLog* unsupported_log)
{
    const Dialect dialect = Dialect::marlin();
    GcodeParser parser(dialect, unsupported_log);
    std::istringstream in(gcode);
    return parser.parse(in);
}

std::vector<Layer> segmentGcode(const std::string& gcode)
{
    return Segmenter::segment(parseGcode(gcode));
}

std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    return lines;
}

std::multiset<std::string> extrudingLines(const std::string& gcode)
{
    const ParsedProgram program = parseGcode(gcode);
    std::multiset<std::string> result;
    for (const Command& command : program.commands)
    {
        if (command.kind == CommandKind::EXTRUDE)
        {
            result.insert(command.raw);
        }
    }
    return result;
}

void writeTextFile(const std::filesystem::path& path, std::string_view content)
{
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open()) << "Could not create " << path;
    out << content;
}

void writeScript(const std::filesystem::path& path, std::string_view content)
{
    writeTextFile(path, content);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec);
}

std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), {});
}

} // namespace travel
