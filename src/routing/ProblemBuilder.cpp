// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/ProblemBuilder.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/concat.hpp>
#include <range/v3/view/single.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "utils/OptimizerError.h"

namespace travel
{

ProblemBuilder::ProblemBuilder(coord_t precision, size_t num_runs)
    : precision_(precision)
    , num_runs_(num_runs)
{
}

std::optional<Problem> ProblemBuilder::build(const Layer& layer) const
{
    if (layer.islands.empty())
    {
        return std::nullopt;
    }

    Problem problem;
    problem.name = fmt::format("layer_{}", layer.layer_nr);
    problem.layer_nr = layer.layer_nr;
    problem.precision = precision_;
    problem.num_runs = num_runs_;

    const auto scale = [this](const Position& position)
    {
        return scaled(position.x, position.y, precision_);
    };
    problem.nodes = ranges::views::concat(ranges::views::single(scale(layer.start())), layer.islands | ranges::views::transform([&](const Island& island) { return scale(island.entry); }))
                  | ranges::to_vector;

    const size_t dimension = problem.dimension();
    problem.distances.assign(dimension * dimension, 0);
    for (size_t from = 0; from < dimension; from++)
    {
        for (size_t to = from + 1; to < dimension; to++)
        {
            const coord_t distance = vSize(problem.nodes[to] - problem.nodes[from]);
            problem.distances[from * dimension + to] = distance;
            problem.distances[to * dimension + from] = distance;
        }
    }
    return problem;
}

void ProblemBuilder::write(const Problem& problem, std::ostream& out)
{
    out << "NAME : " << problem.name << "\n";
    out << "COMMENT : layer " << problem.layer_nr << ", " << problem.islandCount() << " islands, RUNS " << problem.num_runs << "\n";
    out << "TYPE : TSP\n";
    out << "DIMENSION : " << problem.dimension() << "\n";
    out << "EDGE_WEIGHT_TYPE : EUC_2D\n";
    out << "NODE_COORD_SECTION\n";
    for (size_t node_idx = 0; node_idx < problem.nodes.size(); node_idx++)
    {
        out << node_idx + 1 << " " << problem.nodes[node_idx].X << " " << problem.nodes[node_idx].Y << "\n";
    }
    out << "EOF\n";
}

void ProblemBuilder::writeFile(const Problem& problem, const std::filesystem::path& path)
{
    std::ofstream out(path);
    if (! out.is_open())
    {
        const int errnum = errno;
        if (isResourceExhaustion(errnum))
        {
            throw ResourceExhaustionError(fmt::format("create {}", path.string()), std::strerror(errnum));
        }
        throw SolverInvocationError(problem.layer_nr, fmt::format("can't create problem file {}: {}", path.string(), std::strerror(errnum)));
    }
    write(problem, out);
    out.close();
    if (out.fail())
    {
        throw SolverInvocationError(problem.layer_nr, fmt::format("failed to write problem file {}", path.string()));
    }
    spdlog::debug("Wrote problem of layer {} with {} nodes to {}", problem.layer_nr, problem.dimension(), path.string());
}

} // namespace travel
