// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_TOUR_READER_H
#define ROUTING_TOUR_READER_H

#include <filesystem>
#include <istream>

#include "routing/Problem.h"
#include "routing/Tour.h"

namespace travel
{

/*!
 * \brief Reads the tours written by the solver, in the TSPLIB tour format.
 */
class TourReader
{
public:
    /*!
     * Read a tour and turn it into an open path from the start node.
     *
     * The solver returns a closed tour. It is rotated to begin at the start node, and of the two directions in which
     * the cycle can be followed, the one with the shorter path (not returning to the start) is kept.
     * \throws TourValidationError if the tour is malformed or isn't a permutation of exactly the problem's nodes.
     */
    [[nodiscard]] static Tour read(std::istream& in, const Problem& problem);

    /*!
     * Read a tour from a file.
     * \throws TourValidationError also if the file doesn't exist or can't be opened.
     */
    [[nodiscard]] static Tour readFile(const std::filesystem::path& path, const Problem& problem);

    /*!
     * The length of the path that visits the nodes in the order given, without returning to the first node.
     */
    [[nodiscard]] static coord_t pathLength(const std::vector<size_t>& nodes, const Problem& problem);
};

} // namespace travel

#endif // ROUTING_TOUR_READER_H
