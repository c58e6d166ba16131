// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "TravelOptimizer.h"

#include <chrono>
#include <fstream>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>
#include <spdlog/spdlog.h>

#include "gcode/Dialect.h"
#include "gcode/GcodeParser.h"
#include "gcode/IslandMerger.h"
#include "gcode/Reconstructor.h"
#include "gcode/Segmenter.h"
#include "routing/ProblemBuilder.h"
#include "routing/SolverOrchestrator.h"
#include "utils/OptimizerError.h"
#include "utils/gettime.h"

namespace travel
{

TravelOptimizer::TravelOptimizer(const Config& config, const Solver& solver, ThreadPool& thread_pool)
    : config_(config)
    , solver_(solver)
    , thread_pool_(thread_pool)
{
}

OptimizationResult TravelOptimizer::optimize(std::istream& in, std::ostream& out, std::string_view source_name, UnsupportedCommandLog* unsupported_log)
{
    TimeKeeper timer;
    OptimizationResult result;

    Dialect dialect = Dialect::marlin();
    dialect.addPassthrough(config_.extra_passthrough_commands);
    GcodeParser parser(dialect, unsupported_log);
    ParsedProgram program = parser.parse(in);
    spdlog::info("Read {} lines", program.commands.size());
    result.input = Statistics::of(program);
    timer.registerTime("parse");

    std::vector<Layer> layers = Segmenter::segment(std::move(program));
    const IslandMerger merger(config_.max_merge_length);
    const ProblemBuilder builder(static_cast<coord_t>(config_.precision), config_.num_runs);

    std::vector<std::optional<Problem>> problems;
    problems.reserve(layers.size());
    result.layers.reserve(layers.size());
    for (Layer& layer : layers)
    {
        LayerReport report;
        report.layer_nr = layer.layer_nr;
        report.islands = layer.islands.size();
        layer.islands = merger.merge(layer.islands);
        report.merged_islands = layer.islands.size();

        std::optional<Problem> problem;
        if (layer.islands.size() < config_.minimum_nodes)
        {
            report.status = "skipped";
        }
        else if (! Reconstructor::canReorder(layer))
        {
            spdlog::info("Layer {} changes the machine mode between its islands, keeping its order", layer.layer_nr);
            report.status = "kept";
        }
        else
        {
            problem = builder.build(layer);
        }
        spdlog::debug("Layer {} at z {}: {} islands, {} after merging", layer.layer_nr, layer.z, report.islands, report.merged_islands);
        problems.push_back(std::move(problem));
        result.layers.push_back(std::move(report));
    }
    spdlog::info("Found {} layers, {} of which will be routed", layers.size(), ranges::count_if(problems, [](const std::optional<Problem>& problem) { return problem.has_value(); }));
    timer.registerTime("segment");

    Reconstructor reconstructor(out);
    reconstructor.writeHeader(source_name);

    const auto timeout = config_.timeout.toMilliseconds();
    SolverOrchestrator orchestrator(solver_, thread_pool_, config_.max_workers, timeout, std::filesystem::temp_directory_path());
    size_t layer_idx = 0; // Solutions arrive in layer order.
    orchestrator.solveAll(
        problems,
        [&](LayerSolution&& solution)
        {
            const Layer& layer = layers[layer_idx];
            LayerReport& report = result.layers[layer_idx];
            layer_idx++;
            if (solution.solved())
            {
                reconstructor.emit(layer, solution.tour->islandOrder());
                report.status = "solved";
                result.solved_layers++;
            }
            else
            {
                reconstructor.emit(layer, {});
                if (solution.failure)
                {
                    report.status = "fallback";
                    result.failed_layers++;
                }
            }
            if (! out)
            {
                throw InputError(fmt::format("Could not write the output after layer {}", solution.layer_nr));
            }
        });
    out.flush();
    if (! out)
    {
        throw InputError("Could not write the output");
    }
    timer.registerTime("solve and write");

    result.output = reconstructor.statistics();
    result.added_commands = reconstructor.addedCommandCount();
    result.dropped_travels = reconstructor.droppedTravelCount();
    if (result.output.extrusion_count != result.input.extrusion_count)
    {
        spdlog::warn("The output has {} extruding moves but the input had {}", result.output.extrusion_count, result.input.extrusion_count);
    }

    spdlog::info(
        "Routed {} layers, {} fell back to their original order. Added {} and dropped {} travel moves",
        result.solved_layers,
        result.failed_layers,
        result.added_commands,
        result.dropped_travels);
    for (const TimeKeeper::RegisteredTime& registered : timer.getRegisteredTimes())
    {
        spdlog::debug("{}: {:.3f}s", registered.stage, static_cast<double>(registered.duration));
    }
    return result;
}

OptimizationResult TravelOptimizer::optimizeFile(const std::filesystem::path& input, UnsupportedCommandLog* unsupported_log)
{
    validateInput(input);

    std::ifstream in(input);
    if (! in)
    {
        throw InputError(fmt::format("Could not open {}", input.string()));
    }
    const std::filesystem::path output_path = outputPathFor(input);
    std::ofstream out(output_path);
    if (! out)
    {
        throw InputError(fmt::format("Could not open {} for writing", output_path.string()));
    }
    spdlog::info("Optimising {} into {}", input.string(), output_path.string());

    OptimizationResult result = optimize(in, out, input.filename().string(), unsupported_log);

    const std::filesystem::path report_path = reportPathFor(input);
    std::ofstream report(report_path);
    writeReport(result.layers, report);
    if (! report)
    {
        throw InputError(fmt::format("Could not write the layer report to {}", report_path.string()));
    }

    result.input.log("Input");
    result.output.log("Output");
    spdlog::info("Saved {:.2f} mm of travel", result.input.travel_distance - result.output.travel_distance);
    return result;
}

void TravelOptimizer::validateInput(const std::filesystem::path& input)
{
    std::error_code error;
    if (! std::filesystem::is_regular_file(input, error))
    {
        throw InputError(fmt::format("{} does not exist or is not a file", input.string()));
    }
    if (input.extension() != ".gcode")
    {
        throw InputError(fmt::format("{} is not a .gcode file", input.string()));
    }
    const auto size = std::filesystem::file_size(input, error);
    if (error || size == 0)
    {
        throw InputError(fmt::format("{} is empty", input.string()));
    }
}

std::filesystem::path TravelOptimizer::outputPathFor(const std::filesystem::path& input)
{
    std::filesystem::path output = input;
    output.replace_filename(fmt::format("{}_optimized.gcode", input.stem().string()));
    return output;
}

std::filesystem::path TravelOptimizer::reportPathFor(const std::filesystem::path& input)
{
    std::filesystem::path report = input;
    report += ".csv";
    return report;
}

void TravelOptimizer::writeReport(const std::vector<LayerReport>& layers, std::ostream& out)
{
    out << "layer,islands,merged_islands,status\n";
    for (const LayerReport& layer : layers)
    {
        out << fmt::format("{},{},{},{}\n", layer.layer_nr, layer.islands, layer.merged_islands, layer.status);
    }
}

} // namespace travel
