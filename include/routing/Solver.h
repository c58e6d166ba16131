// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_SOLVER_H
#define ROUTING_SOLVER_H

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include "routing/Problem.h"

namespace travel
{

enum class SolverStatus
{
    COMPLETED, //!< The solver exited with status 0. Whether it wrote a tour is up to the caller to check.
    NON_ZERO_EXIT,
    TIMED_OUT,
    SPAWN_FAILED, //!< The solver could not be started at all.
};

[[nodiscard]] constexpr std::string_view toString(const SolverStatus status)
{
    switch (status)
    {
    case SolverStatus::COMPLETED:
        return "completed";
    case SolverStatus::NON_ZERO_EXIT:
        return "non-zero exit";
    case SolverStatus::TIMED_OUT:
        return "timed out";
    case SolverStatus::SPAWN_FAILED:
        return "spawn failed";
    }
    return "unknown";
}

/*!
 * Everything a solver needs to solve one problem.
 */
struct SolverInvocation
{
    const Problem& problem;
    std::filesystem::path problem_file; //!< Already written.
    std::filesystem::path tour_file; //!< Where the solver is expected to write its tour.
    std::filesystem::path workspace; //!< Scratch directory, removed after the invocation.
    std::chrono::milliseconds timeout;
};

struct SolverRun
{
    SolverStatus status = SolverStatus::COMPLETED;
    int exit_code = 0;
    std::string message; //!< Human readable details for failed runs.
};

/*!
 * \brief Computes a tour for a problem file.
 *
 * Implementations must be safe to call from several threads at once.
 */
class Solver
{
public:
    virtual ~Solver() = default;

    /*!
     * Solve a problem.
     * \throws ResourceExhaustionError when the operating system refuses to create the process or its files.
     */
    virtual SolverRun run(const SolverInvocation& invocation) const = 0;
};

/*!
 * Where a solver writes the tour for a problem file: beside it, with the same stem and the ".tour" extension.
 */
[[nodiscard]] inline std::filesystem::path tourFileFor(const std::filesystem::path& problem_file)
{
    std::filesystem::path tour_file = problem_file;
    tour_file.replace_extension(".tour");
    return tour_file;
}

} // namespace travel

#endif // ROUTING_SOLVER_H
