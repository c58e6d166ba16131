// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/SolverOrchestrator.h"

#include <algorithm>
#include <atomic>
#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "routing/ProblemBuilder.h"
#include "routing/ScopedWorkspace.h"
#include "routing/TourReader.h"
#include "utils/ThreadPool.h"

namespace travel
{

SolverOrchestrator::AdmissionGate::AdmissionGate(size_t capacity)
    : capacity_(std::max(capacity, size_t{ 1 }))
{
}

SolverOrchestrator::AdmissionGate::Ticket::Ticket(AdmissionGate& gate)
    : gate_(gate)
{
    std::unique_lock<std::mutex> lock(gate_.mutex_);
    gate_.slot_freed_.wait(
        lock,
        [this]
        {
            return gate_.running_ < gate_.capacity_;
        });
    gate_.running_++;
}

SolverOrchestrator::AdmissionGate::Ticket::~Ticket()
{
    {
        std::lock_guard<std::mutex> lock(gate_.mutex_);
        gate_.running_--;
    }
    gate_.slot_freed_.notify_one();
}

SolverOrchestrator::SolverOrchestrator(const Solver& solver, ThreadPool& thread_pool, size_t max_workers, std::chrono::milliseconds timeout, std::filesystem::path temp_root)
    : solver_(solver)
    , thread_pool_(thread_pool)
    , gate_(max_workers)
    , timeout_(timeout)
    , temp_root_(std::move(temp_root))
{
}

void SolverOrchestrator::solveAll(const std::vector<std::optional<Problem>>& problems, const consumer_t& consumer)
{
    std::mutex fatal_mutex;
    std::exception_ptr fatal_error;
    std::atomic<bool> aborted{ false };
    const auto record_fatal = [&]()
    {
        std::lock_guard<std::mutex> lock(fatal_mutex);
        if (! fatal_error)
        {
            fatal_error = std::current_exception();
        }
        aborted = true;
    };

    run_multiple_producers_ordered_consumer(
        thread_pool_,
        0,
        static_cast<ptrdiff_t>(problems.size()),
        [&](const ptrdiff_t layer_idx) -> std::optional<LayerSolution>
        {
            LayerSolution solution;
            solution.layer_nr = static_cast<size_t>(layer_idx);
            const std::optional<Problem>& problem = problems[static_cast<size_t>(layer_idx)];
            if (! problem || aborted)
            {
                return solution;
            }
            try
            {
                return solve(*problem);
            }
            catch (const std::exception&)
            {
                record_fatal();
            }
            return solution;
        },
        [&](std::optional<LayerSolution>&& solution)
        {
            if (aborted)
            {
                return;
            }
            try
            {
                consumer(std::move(*solution));
            }
            catch (const std::exception&)
            {
                record_fatal();
            }
        });

    if (fatal_error)
    {
        std::rethrow_exception(fatal_error);
    }
}

LayerSolution SolverOrchestrator::solve(const Problem& problem)
{
    LayerSolution solution;
    solution.layer_nr = problem.layer_nr;

    AdmissionGate::Ticket ticket(gate_);
    const ScopedWorkspace workspace(temp_root_, fmt::format("travel_optimizer_layer_{}", problem.layer_nr));
    const std::filesystem::path problem_file = workspace.path() / fmt::format("layer_{}.tsp", problem.layer_nr);
    try
    {
        ProblemBuilder::writeFile(problem, problem_file);
        const SolverInvocation invocation{ problem, problem_file, tourFileFor(problem_file), workspace.path(), timeout_ };
        const SolverRun run = solver_.run(invocation);
        if (run.status != SolverStatus::COMPLETED)
        {
            throw SolverInvocationError(problem.layer_nr, fmt::format("{}, {}", toString(run.status), run.message));
        }
        if (! std::filesystem::exists(invocation.tour_file))
        {
            throw SolverInvocationError(problem.layer_nr, "no tour was written");
        }
        solution.tour = TourReader::readFile(invocation.tour_file, problem);
        spdlog::debug(
            "Layer {}: solved {} islands, tour length {}",
            problem.layer_nr,
            problem.islandCount(),
            TourReader::pathLength(solution.tour->nodes, problem));
    }
    catch (const SolverInvocationError& e)
    {
        solution.failure = SolverFailure{ e.kind(), e.what() };
    }
    catch (const TourValidationError& e)
    {
        solution.failure = SolverFailure{ e.kind(), fmt::format("Layer {}: {}", problem.layer_nr, e.what()) };
    }

    if (solution.failure)
    {
        spdlog::warn("{}. Keeping the original island order.", solution.failure->message);
    }
    return solution;
}

} // namespace travel
