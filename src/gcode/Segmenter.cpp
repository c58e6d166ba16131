// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/Segmenter.h"

#include <iterator>
#include <optional>

#include <spdlog/spdlog.h>

#include "utils/math.h"

namespace travel
{

namespace
{

Layer makeLayer(ParsedProgram& program, const size_t begin, const size_t end, const size_t layer_nr, const double z)
{
    Layer layer;
    layer.layer_nr = layer_nr;
    layer.z = z;
    layer.commands.assign(std::make_move_iterator(program.commands.begin() + begin), std::make_move_iterator(program.commands.begin() + end));
    layer.positions.assign(program.positions.begin() + begin, program.positions.begin() + end + 1);
    layer.islands = Segmenter::findIslands(layer);
    spdlog::debug("Layer {} at Z {}: {} commands, {} islands", layer_nr, z, layer.commands.size(), layer.islands.size());
    return layer;
}

} // namespace

std::vector<Layer> Segmenter::segment(ParsedProgram&& program)
{
    std::vector<Layer> layers;
    if (program.commands.empty())
    {
        return layers;
    }

    std::optional<double> layer_z;
    size_t layer_begin = 0;
    size_t last_extrusion = 0;
    for (size_t command_idx = 0; command_idx < program.commands.size(); command_idx++)
    {
        if (program.commands[command_idx].kind != CommandKind::EXTRUDE)
        {
            continue;
        }
        const double z = program.positions[command_idx + 1].z;
        if (! layer_z)
        {
            layer_z = z;
        }
        else if (! fuzzy_equal(z, *layer_z))
        {
            const size_t boundary = last_extrusion + 1;
            layers.push_back(makeLayer(program, layer_begin, boundary, layers.size(), *layer_z));
            layer_begin = boundary;
            layer_z = z;
        }
        last_extrusion = command_idx;
    }
    layers.push_back(makeLayer(program, layer_begin, program.commands.size(), layers.size(), layer_z.value_or(program.positions[layer_begin].z)));
    return layers;
}

std::vector<Island> Segmenter::findIslands(const Layer& layer)
{
    std::vector<Island> islands;
    const auto close_island = [&](const size_t begin, const size_t end)
    {
        Island island;
        island.begin = begin;
        island.end = end;
        island.entry = layer.positions[begin];
        island.exit = layer.positions[end];
        islands.push_back(island);
    };

    std::optional<size_t> island_begin;
    size_t last_extrusion = 0;
    for (size_t command_idx = 0; command_idx < layer.commands.size(); command_idx++)
    {
        switch (layer.commands[command_idx].kind)
        {
        case CommandKind::EXTRUDE:
            if (! island_begin)
            {
                island_begin = command_idx;
            }
            last_extrusion = command_idx;
            break;
        case CommandKind::TRAVEL:
        case CommandKind::HOME:
            if (island_begin)
            {
                close_island(*island_begin, last_extrusion + 1);
                island_begin.reset();
            }
            break;
        default:
            break;
        }
    }
    if (island_begin)
    {
        close_island(*island_begin, last_extrusion + 1);
    }
    return islands;
}

} // namespace travel
