// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef TRAVEL_OPTIMIZER_H
#define TRAVEL_OPTIMIZER_H

#include <cstddef>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "Statistics.h"
#include "settings/Config.h"

namespace travel
{

class Solver;
class ThreadPool;
class UnsupportedCommandLog;

/*!
 * What happened to one layer.
 */
struct LayerReport
{
    size_t layer_nr = 0;
    size_t islands = 0; //!< As found by the segmenter.
    size_t merged_islands = 0; //!< After merging close islands.
    std::string status; //!< "solved", "fallback", "skipped" (too few islands) or "kept" (unsafe to reorder).
};

struct OptimizationResult
{
    Statistics input;
    Statistics output;
    std::vector<LayerReport> layers;
    size_t solved_layers = 0;
    size_t failed_layers = 0;
    size_t added_commands = 0;
    size_t dropped_travels = 0;
};

/*!
 * \brief The whole optimisation of one file: parse, segment, merge, solve and write back.
 */
class TravelOptimizer
{
public:
    /*!
     * \param config The configuration. Must outlive the optimizer.
     * \param solver The solver to route the layers with.
     * \param thread_pool The pool to solve the layers on.
     */
    TravelOptimizer(const Config& config, const Solver& solver, ThreadPool& thread_pool);

    /*!
     * Optimise a G-code stream.
     * \param in The input G-code.
     * \param out Where the optimised G-code goes.
     * \param source_name Name of the input, for the header of the output.
     * \param unsupported_log Where to report unrecognised lines, may be nullptr.
     * \throws ResourceExhaustionError when the system runs out of resources while solving.
     * \throws InputError when the input can't be read or the output can't be written.
     */
    OptimizationResult optimize(std::istream& in, std::ostream& out, std::string_view source_name, UnsupportedCommandLog* unsupported_log);

    /*!
     * Optimise a file, writing the result and a per-layer report beside it.
     * \throws InputError if the input isn't a readable, non-empty .gcode file, or an output can't be written.
     */
    OptimizationResult optimizeFile(const std::filesystem::path& input, UnsupportedCommandLog* unsupported_log);

    /*!
     * Check that a path names a non-empty file with the .gcode extension.
     * \throws InputError otherwise.
     */
    static void validateInput(const std::filesystem::path& input);

    //! "model.gcode" becomes "model_optimized.gcode", in the same directory.
    static std::filesystem::path outputPathFor(const std::filesystem::path& input);

    //! "model.gcode" becomes "model.gcode.csv".
    static std::filesystem::path reportPathFor(const std::filesystem::path& input);

    /*!
     * Write the per-layer report as CSV.
     */
    static void writeReport(const std::vector<LayerReport>& layers, std::ostream& out);

private:
    const Config& config_;
    const Solver& solver_;
    ThreadPool& thread_pool_;
};

} // namespace travel

#endif // TRAVEL_OPTIMIZER_H
