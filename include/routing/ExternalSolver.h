// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_EXTERNAL_SOLVER_H
#define ROUTING_EXTERNAL_SOLVER_H

#include <chrono>
#include <filesystem>

#include "routing/Solver.h"

namespace travel
{

/*!
 * \brief Runs the configured solver executable as a child process.
 *
 * The executable is started as `program <problem file> <number of runs>` from the directory that contains it, with
 * its output redirected to a file in the workspace. It is killed when it runs longer than the timeout.
 */
class ExternalSolver : public Solver
{
public:
    explicit ExternalSolver(const std::filesystem::path& program, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10));

    SolverRun run(const SolverInvocation& invocation) const override;

    [[nodiscard]] const std::filesystem::path& program() const
    {
        return program_;
    }

private:
    std::filesystem::path program_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace travel

#endif // ROUTING_EXTERNAL_SOLVER_H
