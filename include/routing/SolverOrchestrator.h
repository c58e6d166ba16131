// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_SOLVER_ORCHESTRATOR_H
#define ROUTING_SOLVER_ORCHESTRATOR_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "routing/Problem.h"
#include "routing/Solver.h"
#include "routing/Tour.h"
#include "utils/OptimizerError.h"

namespace travel
{

class ThreadPool;

/*!
 * Why a layer could not be solved.
 */
struct SolverFailure
{
    ErrorKind kind;
    std::string message;
};

/*!
 * The outcome of routing one layer. A layer without tour keeps its original island order.
 */
struct LayerSolution
{
    size_t layer_nr = 0;
    std::optional<Tour> tour; //!< Set when the layer was solved.
    std::optional<SolverFailure> failure; //!< Set when solving was attempted and failed.

    [[nodiscard]] bool solved() const
    {
        return tour.has_value();
    }
};

/*!
 * \brief Solves the problems of all layers concurrently, while keeping the number of running solvers bounded.
 *
 * Every problem is solved in its own temporary workspace. A failing solver only affects its own layer, which falls
 * back to its original order with a single warning. Running out of system resources is fatal: the first such error
 * stops further solving and is rethrown on the calling thread.
 */
class SolverOrchestrator
{
public:
    using consumer_t = std::function<void(LayerSolution&&)>;

    /*!
     * \param solver The solver to run. Must be safe to run from several threads.
     * \param thread_pool The pool the layers are solved on.
     * \param max_workers The maximum number of solver runs at any time.
     * \param timeout How long a single solver run may take.
     * \param temp_root Where to create the workspaces.
     */
    SolverOrchestrator(const Solver& solver, ThreadPool& thread_pool, size_t max_workers, std::chrono::milliseconds timeout, std::filesystem::path temp_root);

    /*!
     * Solve a number of layers.
     * \param problems The problem of each layer, or nothing for layers that don't need solving.
     * \param consumer Receives the solution of each layer, in layer order, on one thread at a time.
     * \throws ResourceExhaustionError, or any other fatal error raised while solving.
     */
    void solveAll(const std::vector<std::optional<Problem>>& problems, const consumer_t& consumer);

    /*!
     * Solve a single problem on the calling thread, waiting for a free solver slot first.
     * \throws ResourceExhaustionError when the system runs out of resources.
     */
    [[nodiscard]] LayerSolution solve(const Problem& problem);

private:
    /*!
     * \brief Counts the solver runs in progress and makes callers wait while the maximum is reached.
     */
    class AdmissionGate
    {
    public:
        explicit AdmissionGate(size_t capacity);

        //! Releases its slot on destruction.
        class Ticket
        {
        public:
            explicit Ticket(AdmissionGate& gate);
            ~Ticket();
            Ticket(const Ticket&) = delete;
            Ticket& operator=(const Ticket&) = delete;

        private:
            AdmissionGate& gate_;
        };

    private:
        std::mutex mutex_;
        std::condition_variable slot_freed_;
        size_t capacity_;
        size_t running_ = 0;
    };

    const Solver& solver_;
    ThreadPool& thread_pool_;
    AdmissionGate gate_;
    std::chrono::milliseconds timeout_;
    std::filesystem::path temp_root_;
};

} // namespace travel

#endif // ROUTING_SOLVER_ORCHESTRATOR_H
