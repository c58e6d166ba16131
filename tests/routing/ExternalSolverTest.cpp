// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/ExternalSolver.h" // The file under test.

#include <filesystem>

#include <gtest/gtest.h>

#include "Fixtures.h"
#include "routing/ProblemBuilder.h"
#include "routing/ScopedWorkspace.h"
#include "routing/TourReader.h"

// NOLINTBEGIN(*-magic-numbers)
namespace travel
{

class ExternalSolverTest : public testing::Test
{
public:
    ScopedWorkspace workspace{ std::filesystem::temp_directory_path(), "external_solver_test" };
    Problem problem;
    std::filesystem::path problem_file;

    void SetUp() override
    {
        const std::vector<Layer> layers = segmentGcode(three_islands_gcode);
        problem = *ProblemBuilder(1000, 4).build(layers[0]);
        problem_file = workspace.path() / "layer_0.tsp";
        ProblemBuilder::writeFile(problem, problem_file);
    }

    SolverRun run(const std::filesystem::path& program, std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) const
    {
        const ExternalSolver solver(program, std::chrono::milliseconds(1));
        return solver.run(SolverInvocation{ problem, problem_file, tourFileFor(problem_file), workspace.path(), timeout });
    }

    std::filesystem::path script(const std::string& name, const std::string& body) const
    {
        const std::filesystem::path path = workspace.path() / name;
        writeScript(path, "#!/bin/sh\n" + body);
        return path;
    }
};

TEST_F(ExternalSolverTest, Completed)
{
    const SolverRun result = run("/bin/true");
    EXPECT_EQ(result.status, SolverStatus::COMPLETED);
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(ExternalSolverTest, NonZeroExit)
{
    const SolverRun result = run("/bin/false");
    EXPECT_EQ(result.status, SolverStatus::NON_ZERO_EXIT);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(ExternalSolverTest, FailureMessageHasOutput)
{
    const SolverRun result = run(script("failing.sh", "echo 'reading problem' \necho 'out of nodes' >&2\nexit 3\n"));
    EXPECT_EQ(result.status, SolverStatus::NON_ZERO_EXIT);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.message, "exit code 3: out of nodes");
}

TEST_F(ExternalSolverTest, SpawnFailed)
{
    const SolverRun result = run(workspace.path() / "does_not_exist");
    EXPECT_EQ(result.status, SolverStatus::SPAWN_FAILED);
    EXPECT_NE(result.message.find("can't execute"), std::string::npos) << result.message;
}

TEST_F(ExternalSolverTest, TimedOut)
{
    const auto start = std::chrono::steady_clock::now();
    const SolverRun result = run(script("slow.sh", "exec sleep 30\n"), std::chrono::milliseconds(200));
    EXPECT_EQ(result.status, SolverStatus::TIMED_OUT);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10)) << "The solver must be killed, not waited for.";
}

TEST_F(ExternalSolverTest, WritesTour)
{
    // Writes the identity tour beside the problem file, and records how it was called.
    const std::filesystem::path program = script(
        "solver.sh",
        "pwd -P > cwd.txt\n"
        "echo \"$2\" > runs.txt\n"
        "tour=\"${1%.tsp}.tour\"\n"
        "printf 'NAME : layer_0.tour\\nTYPE : TOUR\\nDIMENSION : 4\\nTOUR_SECTION\\n1\\n2\\n3\\n4\\n-1\\nEOF\\n' > \"$tour\"\n");
    const SolverRun result = run(program);
    ASSERT_EQ(result.status, SolverStatus::COMPLETED) << result.message;

    EXPECT_EQ(readTextFile(workspace.path() / "runs.txt"), "4\n");
    const std::vector<std::string> cwd = splitLines(readTextFile(workspace.path() / "cwd.txt"));
    ASSERT_EQ(cwd.size(), 1);
    EXPECT_EQ(std::filesystem::path(cwd[0]), std::filesystem::canonical(workspace.path())) << "The solver runs from its own directory.";

    const Tour tour = TourReader::readFile(tourFileFor(problem_file), problem);
    EXPECT_EQ(tour.nodes.size(), 4);
}

TEST_F(ExternalSolverTest, OutputGoesToWorkspace)
{
    const SolverRun result = run(script("chatty.sh", "echo 'iteration 1'\n"));
    EXPECT_EQ(result.status, SolverStatus::COMPLETED);
    EXPECT_EQ(readTextFile(workspace.path() / "solver_output.txt"), "iteration 1\n");
}

} // namespace travel
// NOLINTEND(*-magic-numbers)
