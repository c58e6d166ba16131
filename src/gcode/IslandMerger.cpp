// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "gcode/IslandMerger.h"

namespace travel
{

IslandMerger::IslandMerger(double max_merge_length)
    : max_merge_length_(max_merge_length)
{
}

std::vector<Island> IslandMerger::merge(const std::vector<Island>& islands) const
{
    std::vector<Island> result;
    result.reserve(islands.size());
    for (size_t island_idx = 0; island_idx < islands.size(); island_idx++)
    {
        const Island& island = islands[island_idx];
        if (island_idx > 0)
        {
            const Island& previous = islands[island_idx - 1];
            const double distance = (island.entry.point() - previous.entry.point()).vSizeXY();
            if (distance < max_merge_length_)
            {
                Island& composite = result.back();
                composite.end = island.end;
                composite.exit = island.exit;
                composite.merged_count += island.merged_count;
                continue;
            }
        }
        result.push_back(island);
    }
    return result;
}

} // namespace travel
