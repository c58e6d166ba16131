// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/Position.h"

#include "gcode/Command.h"

namespace travel
{

double Position::extrusionDelta(const Command& command) const
{
    if (! command.isMove() || ! command.e.has_value())
    {
        return 0.0;
    }
    return absolute_extrusion ? *command.e - e : *command.e;
}

void Position::apply(const Command& command)
{
    switch (command.category)
    {
    case CommandCategory::MOVE:
    case CommandCategory::ARC:
    {
        const auto axis = [this](double& current, const std::optional<double>& word)
        {
            if (word.has_value())
            {
                current = absolute_positioning ? *word : current + *word;
            }
        };
        axis(x, command.x);
        axis(y, command.y);
        axis(z, command.z);
        if (command.e.has_value())
        {
            e = absolute_extrusion ? *command.e : e + *command.e;
        }
        if (command.f.has_value())
        {
            feedrate = *command.f;
        }
        break;
    }
    case CommandCategory::HOME:
        // G28 without axes homes all of them.
        if (! command.x && ! command.y && ! command.z)
        {
            x = y = z = 0.0;
        }
        else
        {
            x = command.x ? 0.0 : x;
            y = command.y ? 0.0 : y;
            z = command.z ? 0.0 : z;
        }
        break;
    case CommandCategory::SET_POSITION:
        if (! command.hasAxisWords())
        {
            x = y = z = e = 0.0;
            break;
        }
        x = command.x.value_or(x);
        y = command.y.value_or(y);
        z = command.z.value_or(z);
        e = command.e.value_or(e);
        break;
    case CommandCategory::ABSOLUTE_POSITIONING:
        // G90 and G91 also set the extruder axis, until an M82 or M83 overrides it.
        absolute_positioning = true;
        absolute_extrusion = true;
        break;
    case CommandCategory::RELATIVE_POSITIONING:
        absolute_positioning = false;
        absolute_extrusion = false;
        break;
    case CommandCategory::ABSOLUTE_EXTRUSION:
        absolute_extrusion = true;
        break;
    case CommandCategory::RELATIVE_EXTRUSION:
        absolute_extrusion = false;
        break;
    case CommandCategory::UNITS_MILLIMETERS:
        units = UnitsMode::MILLIMETERS;
        break;
    case CommandCategory::UNITS_INCHES:
        units = UnitsMode::INCHES;
        break;
    case CommandCategory::PASSTHROUGH:
        break;
    }
}

} // namespace travel
