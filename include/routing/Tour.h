// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_TOUR_H
#define ROUTING_TOUR_H

#include <cstddef>
#include <optional>
#include <vector>

#include "geometry/Point2LL.h"

namespace travel
{

/*!
 * An order in which to visit the nodes of a problem, starting at the virtual start node.
 */
struct Tour
{
    std::vector<size_t> nodes; //!< 0-based node indices. nodes[0] is always the start node.
    std::optional<coord_t> reported_length; //!< The tour length according to the solver, if it said so.

    /*!
     * The island indices in visiting order, leaving out the start node.
     */
    [[nodiscard]] std::vector<size_t> islandOrder() const
    {
        std::vector<size_t> order;
        order.reserve(nodes.empty() ? 0 : nodes.size() - 1);
        for (size_t idx = 1; idx < nodes.size(); idx++)
        {
            order.push_back(nodes[idx] - 1);
        }
        return order;
    }
};

} // namespace travel

#endif // ROUTING_TOUR_H
