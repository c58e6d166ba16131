// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_ISLAND_MERGER_H
#define GCODE_ISLAND_MERGER_H

#include <vector>

#include "gcode/Island.h"

namespace travel
{

/*!
 * \brief Combines islands that are too close together to be worth routing separately.
 *
 * Walks the islands in file order and adds each island to the current composite if its entry lies strictly closer
 * than the threshold to the entry of the island before it. This keeps the result independent of the order in which
 * distances would be compared and so reproducible between runs.
 *
 * A composite covers the whole command range from its first to its last island, so the connectors between the
 * merged islands stay where they are.
 */
class IslandMerger
{
public:
    explicit IslandMerger(double max_merge_length);

    /*!
     * Merge the islands of one layer.
     * \param islands The islands as found by the segmenter, in file order.
     * \return The composite islands, in file order.
     */
    [[nodiscard]] std::vector<Island> merge(const std::vector<Island>& islands) const;

private:
    double max_merge_length_;
};

} // namespace travel

#endif // GCODE_ISLAND_MERGER_H
