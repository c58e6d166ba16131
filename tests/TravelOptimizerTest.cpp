// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "TravelOptimizer.h" // The file under test.

#include <filesystem>
#include <sstream>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include "FakeSolver.h"
#include "Fixtures.h"
#include "gcode/UnsupportedCommandLog.h"
#include "routing/ScopedWorkspace.h"
#include "utils/OptimizerError.h"
#include "utils/ThreadPool.h"

// NOLINTBEGIN(*-magic-numbers)
namespace travel
{

class TravelOptimizerTest : public testing::Test
{
public:
    Config config;
    ThreadPool thread_pool{ 2 };

    void SetUp() override
    {
        config.program = "/bin/sh";
        config.precision = 1000;
        config.num_runs = 1;
        config.minimum_nodes = 2;
        config.max_workers = 2;
        config.timeout = 1.0;
    }

    OptimizationResult optimize(const Solver& solver, const std::string& gcode, std::string& output, UnsupportedCommandLog* unsupported_log = nullptr)
    {
        TravelOptimizer optimizer(config, solver, thread_pool);
        std::istringstream in(gcode);
        std::ostringstream out;
        OptimizationResult result = optimizer.optimize(in, out, "model.gcode", unsupported_log);
        output = out.str();
        return result;
    }

    static std::string header()
    {
        return ";Travel moves reordered by TravelOptimizer, source: model.gcode\n";
    }
};

TEST_F(TravelOptimizerTest, OptimizesLayers)
{
    const FakeSolver solver;
    std::string output;
    const OptimizationResult result = optimize(solver, three_layers_gcode, output);

    ASSERT_EQ(result.layers.size(), 3);
    EXPECT_EQ(result.layers[0].status, "solved");
    EXPECT_EQ(result.layers[0].islands, 3);
    EXPECT_EQ(result.layers[1].status, "solved");
    EXPECT_EQ(result.layers[2].status, "skipped") << "A single island doesn't need routing.";
    EXPECT_EQ(result.solved_layers, 2);
    EXPECT_EQ(result.failed_layers, 0);
    EXPECT_EQ(solver.callCount(), 2);

    EXPECT_TRUE(output.starts_with(header()));
    EXPECT_EQ(extrudingLines(output), extrudingLines(three_layers_gcode)) << "Every extruding move is written exactly once.";
    EXPECT_EQ(result.output.extrusion_count, result.input.extrusion_count);
    EXPECT_LT(result.output.travel_distance, result.input.travel_distance);
    EXPECT_GT(result.dropped_travels, 0);

    const std::vector<std::string> lines = splitLines(output);
    EXPECT_EQ(lines[1], ";FLAVOR:Marlin") << "The start code stays in front.";
    EXPECT_EQ(lines.back(), "M84") << "The end code stays at the end.";
}

TEST_F(TravelOptimizerTest, FailingSolverKeepsInput)
{
    const FakeSolver solver(FakeSolver::Behaviour::FAIL);
    std::string output;
    const OptimizationResult result = optimize(solver, three_layers_gcode, output);

    EXPECT_EQ(output, header() + three_layers_gcode) << "Without tours, every layer is written as it was.";
    EXPECT_EQ(result.failed_layers, 2);
    EXPECT_EQ(result.solved_layers, 0);
    EXPECT_EQ(result.layers[0].status, "fallback");
    EXPECT_EQ(result.layers[2].status, "skipped");
    EXPECT_EQ(result.added_commands, 0);
}

TEST_F(TravelOptimizerTest, PartialFailure)
{
    FakeSolver solver;
    solver.failOnLayers({ 0 });
    std::string output;
    const OptimizationResult result = optimize(solver, three_layers_gcode, output);
    EXPECT_EQ(result.layers[0].status, "fallback");
    EXPECT_EQ(result.layers[1].status, "solved");
    EXPECT_EQ(extrudingLines(output), extrudingLines(three_layers_gcode));
}

TEST_F(TravelOptimizerTest, MergingSkipsLayers)
{
    config.max_merge_length = 100.0;
    const FakeSolver solver;
    std::string output;
    const OptimizationResult result = optimize(solver, three_layers_gcode, output);
    EXPECT_EQ(result.layers[0].islands, 3);
    EXPECT_EQ(result.layers[0].merged_islands, 1);
    EXPECT_EQ(result.layers[0].status, "skipped");
    EXPECT_EQ(solver.callCount(), 0);
    EXPECT_EQ(output, header() + three_layers_gcode);
}

TEST_F(TravelOptimizerTest, MinimumNodes)
{
    config.minimum_nodes = 3;
    const FakeSolver solver;
    std::string output;
    const OptimizationResult result = optimize(solver, three_layers_gcode, output);
    EXPECT_EQ(result.layers[0].status, "solved");
    EXPECT_EQ(result.layers[1].status, "skipped");
    EXPECT_EQ(solver.callCount(), 1);
}

TEST_F(TravelOptimizerTest, ModeChangeKeepsLayer)
{
    const std::string gcode = "G1 Z0.2\nG1 X1 Y0 E1\nM83\nG0 X10 Y0\nG1 X11 Y0 E1\nG0 X5 Y0\nG1 X6 Y0 E1\n";
    const FakeSolver solver;
    std::string output;
    const OptimizationResult result = optimize(solver, gcode, output);
    ASSERT_EQ(result.layers.size(), 1);
    EXPECT_EQ(result.layers[0].status, "kept");
    EXPECT_EQ(solver.callCount(), 0);
    EXPECT_EQ(output, header() + gcode);
}

TEST_F(TravelOptimizerTest, RelativePositioning)
{
    const std::string gcode = "G91\nG1 Z0.2\nG0 X20 Y0\nG1 X10 E0.5\nG1 X10 E0.5\nG0 X-35 Y5\nG1 X10 E1.0\n";
    const FakeSolver solver;
    std::string output;
    const OptimizationResult result = optimize(solver, gcode, output);

    ASSERT_EQ(result.layers.size(), 1);
    EXPECT_EQ(result.layers[0].islands, 2);
    EXPECT_EQ(result.layers[0].status, "solved");
    EXPECT_EQ(result.input.extrusion_count, 3);
    EXPECT_EQ(result.output.extrusion_count, 3);
    EXPECT_EQ(extrudingLines(output), extrudingLines(gcode));

    const std::vector<std::string> expected{ "G91", "G1 Z0.2", "G0 X5 Y5", "G1 X10 E1.0", "G0 X5 Y-5", "G1 X10 E0.5", "G1 X10 E0.5" };
    std::vector<std::string> lines = splitLines(output);
    lines.erase(lines.begin());
    EXPECT_EQ(lines, expected) << "Printed segments keep their XY, only the travels between them are replaced.";
}

TEST_F(TravelOptimizerTest, ExtraPassthroughCommands)
{
    const FakeSolver solver;
    std::ostringstream unsupported_output;
    UnsupportedCommandLog unsupported_log(std::make_shared<spdlog::sinks::ostream_sink_mt>(unsupported_output));
    std::string output;

    optimize(solver, "M600\nG1 X1 Y0 E1\n", output, &unsupported_log);
    EXPECT_EQ(unsupported_log.count(), 1);

    config.extra_passthrough_commands = { "M600" };
    UnsupportedCommandLog configured_log(std::make_shared<spdlog::sinks::ostream_sink_mt>(unsupported_output));
    optimize(solver, "M600\nG1 X1 Y0 E1\n", output, &configured_log);
    EXPECT_EQ(configured_log.count(), 0);
    EXPECT_EQ(output, header() + "M600\nG1 X1 Y0 E1\n") << "Unsupported lines are passed through either way.";
}

TEST_F(TravelOptimizerTest, ResourceExhaustionAborts)
{
    const FakeSolver solver(FakeSolver::Behaviour::EXHAUST_RESOURCES);
    std::string output;
    EXPECT_THROW(optimize(solver, three_layers_gcode, output), ResourceExhaustionError);
}

TEST_F(TravelOptimizerTest, BrokenOutput)
{
    const FakeSolver solver;
    TravelOptimizer optimizer(config, solver, thread_pool);
    std::istringstream in(three_layers_gcode);
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(optimizer.optimize(in, out, "model.gcode", nullptr), InputError);
}

TEST_F(TravelOptimizerTest, OptimizeFile)
{
    const FakeSolver solver;
    const ScopedWorkspace workspace(std::filesystem::temp_directory_path(), "travel_optimizer_test");
    const std::filesystem::path input = workspace.path() / "model.gcode";
    writeTextFile(input, three_layers_gcode);

    TravelOptimizer optimizer(config, solver, thread_pool);
    const OptimizationResult result = optimizer.optimizeFile(input, nullptr);
    EXPECT_EQ(result.solved_layers, 2);

    const std::string output = readTextFile(workspace.path() / "model_optimized.gcode");
    EXPECT_TRUE(output.starts_with(header()));
    EXPECT_EQ(extrudingLines(output), extrudingLines(three_layers_gcode));

    EXPECT_EQ(readTextFile(workspace.path() / "model.gcode.csv"), "layer,islands,merged_islands,status\n0,3,3,solved\n1,2,2,solved\n2,1,1,skipped\n");
    EXPECT_EQ(readTextFile(input), three_layers_gcode) << "The input is left alone.";
}

TEST_F(TravelOptimizerTest, ValidateInput)
{
    const ScopedWorkspace workspace(std::filesystem::temp_directory_path(), "travel_optimizer_test");

    EXPECT_THROW(TravelOptimizer::validateInput(workspace.path() / "missing.gcode"), InputError);
    EXPECT_THROW(TravelOptimizer::validateInput(workspace.path()), InputError) << "A directory isn't an input file.";

    const std::filesystem::path wrong_extension = workspace.path() / "model.txt";
    writeTextFile(wrong_extension, "G28\n");
    EXPECT_THROW(TravelOptimizer::validateInput(wrong_extension), InputError);

    const std::filesystem::path empty = workspace.path() / "empty.gcode";
    writeTextFile(empty, "");
    try
    {
        TravelOptimizer::validateInput(empty);
        FAIL() << "An empty file must be rejected.";
    }
    catch (const InputError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::INPUT);
        EXPECT_EQ(std::string(e.what()), empty.string() + " is empty");
    }

    const std::filesystem::path valid = workspace.path() / "model.gcode";
    writeTextFile(valid, "G28\n");
    EXPECT_NO_THROW(TravelOptimizer::validateInput(valid));
}

TEST_F(TravelOptimizerTest, OutputPaths)
{
    EXPECT_EQ(TravelOptimizer::outputPathFor("/prints/benchy.gcode"), std::filesystem::path("/prints/benchy_optimized.gcode"));
    EXPECT_EQ(TravelOptimizer::outputPathFor("benchy.gcode"), std::filesystem::path("benchy_optimized.gcode"));
    EXPECT_EQ(TravelOptimizer::reportPathFor("/prints/benchy.gcode"), std::filesystem::path("/prints/benchy.gcode.csv"));
}

TEST_F(TravelOptimizerTest, WriteReport)
{
    std::ostringstream out;
    TravelOptimizer::writeReport({ { 0, 4, 3, "solved" }, { 1, 1, 1, "skipped" } }, out);
    EXPECT_EQ(out.str(), "layer,islands,merged_islands,status\n0,4,3,solved\n1,1,1,skipped\n");
}

} // namespace travel
// NOLINTEND(*-magic-numbers)
