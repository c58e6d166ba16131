// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_PROBLEM_H
#define ROUTING_PROBLEM_H

#include <cstddef>
#include <string>
#include <vector>

#include "geometry/Point2LL.h"

namespace travel
{

/*!
 * \brief The routing problem of one layer, in the integer domain of the solver.
 *
 * Node 0 is the virtual start node: where the tool is when the layer starts. Node i (i >= 1) is the entry of island
 * i - 1 of the layer.
 */
struct Problem
{
    std::string name;
    size_t layer_nr = 0;
    coord_t precision = 1; //!< Scale factor from machine coordinates to node coordinates.
    size_t num_runs = 1; //!< How many times the solver should repeat its search.

    std::vector<Point2LL> nodes;
    std::vector<coord_t> distances; //!< Row-major, dimension() x dimension().

    static constexpr size_t start_node = 0;

    [[nodiscard]] size_t dimension() const
    {
        return nodes.size();
    }

    [[nodiscard]] size_t islandCount() const
    {
        return nodes.empty() ? 0 : nodes.size() - 1;
    }

    [[nodiscard]] coord_t distance(const size_t from, const size_t to) const
    {
        return distances[from * nodes.size() + to];
    }

    /*!
     * Recover a machine coordinate from a scaled one.
     */
    [[nodiscard]] double unscale(const coord_t value) const
    {
        return static_cast<double>(value) / static_cast<double>(precision);
    }
};

} // namespace travel

#endif // ROUTING_PROBLEM_H
