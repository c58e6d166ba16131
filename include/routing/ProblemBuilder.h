// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_PROBLEM_BUILDER_H
#define ROUTING_PROBLEM_BUILDER_H

#include <filesystem>
#include <optional>
#include <ostream>

#include "gcode/Layer.h"
#include "routing/Problem.h"

namespace travel
{

/*!
 * \brief Reduces the islands of a layer to a symmetric travelling salesman problem.
 */
class ProblemBuilder
{
public:
    ProblemBuilder(coord_t precision, size_t num_runs);

    /*!
     * Build the problem of a layer.
     * \param layer The layer, with its (merged) islands.
     * \return The problem, or nothing if the layer has no islands.
     */
    [[nodiscard]] std::optional<Problem> build(const Layer& layer) const;

    /*!
     * Write a problem in the TSPLIB format, with EUC_2D node coordinates.
     */
    static void write(const Problem& problem, std::ostream& out);

    /*!
     * Write a problem to a file.
     * \throws ResourceExhaustionError when the file can't be created because the system ran out of handles or memory.
     * \throws SolverInvocationError when the file can't be written for any other reason.
     */
    static void writeFile(const Problem& problem, const std::filesystem::path& path);

private:
    coord_t precision_;
    size_t num_runs_;
};

} // namespace travel

#endif // ROUTING_PROBLEM_BUILDER_H
