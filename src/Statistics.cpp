// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "Statistics.h"

#include <spdlog/spdlog.h>

namespace travel
{

void Statistics::add(const Command& command, const Position& before, const Position& after)
{
    if (command.code == "G0")
    {
        g0_count++;
    }
    else if (command.code == "G1")
    {
        g1_count++;
    }

    const double distance = (after.point() - before.point()).vSize();
    switch (command.kind)
    {
    case CommandKind::EXTRUDE:
        extrusion_count++;
        extrusion_distance += distance;
        break;
    case CommandKind::TRAVEL:
        travel_count++;
        travel_distance += distance;
        break;
    default:
        break;
    }
}

Statistics Statistics::of(const ParsedProgram& program)
{
    Statistics statistics;
    for (size_t command_idx = 0; command_idx < program.commands.size(); command_idx++)
    {
        statistics.add(program.commands[command_idx], program.positions[command_idx], program.positions[command_idx + 1]);
    }
    return statistics;
}

void Statistics::log(std::string_view label) const
{
    spdlog::info("{}: {} G0 and {} G1 moves", label, g0_count, g1_count);
    spdlog::info("{}: {} extruding moves over {:.2f} mm, {} travel moves over {:.2f} mm", label, extrusion_count, extrusion_distance, travel_count, travel_distance);
}

} // namespace travel
