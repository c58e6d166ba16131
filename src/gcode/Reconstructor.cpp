// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/Reconstructor.h"

#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "utils/math.h"
#include "utils/string.h"

namespace travel
{

namespace
{

const Command* firstMotion(const Layer& layer, const size_t begin, const size_t end)
{
    for (size_t command_idx = begin; command_idx < end; command_idx++)
    {
        if (layer.commands[command_idx].isMove())
        {
            return &layer.commands[command_idx];
        }
    }
    return nullptr;
}

/*!
 * Whether the first move in the plane of a range of commands depends on where the head is when it starts. Only an
 * absolute travel with both X and Y doesn't.
 */
bool dependsOnStartXY(const Layer& layer, const size_t begin, const size_t end)
{
    for (size_t command_idx = begin; command_idx < end; command_idx++)
    {
        const Command& command = layer.commands[command_idx];
        if (command.kind == CommandKind::HOME)
        {
            return false;
        }
        if (! command.isMove() || ! command.hasXY())
        {
            continue;
        }
        return command.kind != CommandKind::TRAVEL || command.category != CommandCategory::MOVE || ! command.x || ! command.y
            || ! layer.positions[command_idx].absolute_positioning;
    }
    return false;
}

Command addedMove(const std::string_view code)
{
    Command command;
    command.kind = CommandKind::TRAVEL;
    command.category = CommandCategory::MOVE;
    command.code = std::string(code);
    return command;
}

} // namespace

Reconstructor::Reconstructor(std::ostream& out)
    : out_(out)
{
}

void Reconstructor::writeHeader(std::string_view source_name)
{
    out_ << ";Travel moves reordered by TravelOptimizer, source: " << source_name << "\n";
}

void Reconstructor::emit(const Layer& layer, const std::vector<size_t>& order)
{
    const size_t island_count = layer.islands.size();
    if (island_count < 2 || order.size() != island_count)
    {
        emitVerbatim(layer);
        return;
    }
    if (! canReorder(layer))
    {
        spdlog::info("Layer {} changes modes between its islands, keeping the original order", layer.layer_nr);
        emitVerbatim(layer);
        return;
    }

    for (size_t position_idx = 0; position_idx < island_count; position_idx++)
    {
        const Island& island = layer.islands[order[position_idx]];
        emitConnector(layer, position_idx, island.entry);
        restoreState(island.entry, firstMotion(layer, island.begin, island.end), true);
        emitRange(layer, island.begin, island.end);
    }
    const size_t trailing_begin = layer.connectorBegin(island_count);
    restoreState(layer.positions[trailing_begin], firstMotion(layer, trailing_begin, layer.commands.size()), dependsOnStartXY(layer, trailing_begin, layer.commands.size()));
    emitRange(layer, trailing_begin, layer.commands.size());
}

bool Reconstructor::canReorder(const Layer& layer)
{
    if (layer.islands.empty())
    {
        return false;
    }
    for (size_t command_idx = layer.islands.front().begin; command_idx < layer.islands.back().end; command_idx++)
    {
        const Command& command = layer.commands[command_idx];
        if (command.changesMode() || command.kind == CommandKind::HOME)
        {
            return false;
        }
    }
    return true;
}

void Reconstructor::emitVerbatim(const Layer& layer)
{
    restoreState(layer.start(), firstMotion(layer, 0, layer.commands.size()), dependsOnStartXY(layer, 0, layer.commands.size()));
    emitRange(layer, 0, layer.commands.size());
}

void Reconstructor::emitConnector(const Layer& layer, const size_t position_idx, const Position& target)
{
    const size_t begin = layer.connectorBegin(position_idx);
    const size_t end = layer.connectorEnd(position_idx);
    restoreState(layer.positions[begin], firstMotion(layer, begin, end), false);

    bool travelled = false;
    for (size_t command_idx = begin; command_idx < end; command_idx++)
    {
        const Command& command = layer.commands[command_idx];
        if (! command.isPlanarTravel())
        {
            emitLine(command);
            continue;
        }

        dropped_travels_++;
        if (command.e)
        {
            // Retract (or prime) while moving: keep the extruder move, but in place.
            Command retract = addedMove("G1");
            retract.z = command.z;
            retract.e = command.e;
            retract.f = command.f;
            emitAdded(std::move(retract));
        }
        else if (! travelled)
        {
            travelTo(target.x, target.y, command.z, command.f);
            travelled = true;
        }
        else if (command.z)
        {
            Command lift = addedMove("G0");
            lift.z = command.z;
            lift.f = command.f;
            emitAdded(std::move(lift));
        }
    }
}

void Reconstructor::emitRange(const Layer& layer, const size_t begin, const size_t end)
{
    for (size_t command_idx = begin; command_idx < end; command_idx++)
    {
        emitLine(layer.commands[command_idx]);
    }
}

void Reconstructor::restoreState(const Position& expected, const Command* first_motion, const bool restore_xy)
{
    if (position_.absolute_extrusion && ! fuzzy_equal(position_.e, expected.e))
    {
        Command reset;
        reset.kind = CommandKind::STATE_CHANGE;
        reset.category = CommandCategory::SET_POSITION;
        reset.code = "G92";
        reset.e = expected.e;
        emitAdded(std::move(reset));
    }
    if (first_motion != nullptr && ! first_motion->f && expected.feedrate > 0.0 && ! fuzzy_equal(position_.feedrate, expected.feedrate))
    {
        Command feedrate = addedMove("G1");
        feedrate.kind = CommandKind::STATE_CHANGE;
        feedrate.f = expected.feedrate;
        emitAdded(std::move(feedrate));
    }
    if (restore_xy)
    {
        std::optional<double> z;
        if (! fuzzy_equal(position_.z, expected.z))
        {
            z = position_.absolute_positioning ? expected.z : expected.z - position_.z;
        }
        travelTo(expected.x, expected.y, z, std::nullopt);
    }
}

void Reconstructor::travelTo(const double x, const double y, const std::optional<double> z, const std::optional<double> f)
{
    Command travel = addedMove("G0");
    travel.f = f;
    travel.z = z;
    if (! fuzzy_equal(position_.x, x) || ! fuzzy_equal(position_.y, y))
    {
        travel.x = position_.absolute_positioning ? x : x - position_.x;
        travel.y = position_.absolute_positioning ? y : y - position_.y;
    }
    if (travel.hasAxisWords())
    {
        emitAdded(std::move(travel));
    }
}

void Reconstructor::emitLine(const Command& command)
{
    out_ << command.raw << "\n";
    const Position before = position_;
    position_.apply(command);
    statistics_.add(command, before, position_);
}

void Reconstructor::emitAdded(Command&& command)
{
    std::ostringstream line;
    line << command.code;
    if (command.f)
    {
        line << " F" << PrecisionedDouble<3>{ *command.f };
    }
    if (command.x)
    {
        line << " X" << PrecisionedDouble<3>{ *command.x };
    }
    if (command.y)
    {
        line << " Y" << PrecisionedDouble<3>{ *command.y };
    }
    if (command.z)
    {
        line << " Z" << PrecisionedDouble<3>{ *command.z };
    }
    if (command.e)
    {
        line << " E" << PrecisionedDouble<5>{ *command.e };
    }
    command.raw = line.str();
    added_commands_++;
    emitLine(command);
}

} // namespace travel
