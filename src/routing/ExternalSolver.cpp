// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/ExternalSolver.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/OptimizerError.h"
#include "utils/string.h"

namespace travel
{

namespace
{

/*!
 * Refuse the invocation if the failure is the system running out of resources, otherwise report a spawn failure.
 */
SolverRun spawnFailure(const std::string_view operation, const int errnum)
{
    if (isResourceExhaustion(errnum))
    {
        throw ResourceExhaustionError(operation, std::strerror(errnum));
    }
    return { SolverStatus::SPAWN_FAILED, -1, fmt::format("{}: {}", operation, std::strerror(errnum)) };
}

/*!
 * The last non-empty line the solver printed, to give some context to a failure.
 */
std::string lastOutputLine(const std::filesystem::path& output_file)
{
    std::ifstream in(output_file);
    std::string line;
    std::string last;
    while (std::getline(in, line))
    {
        if (! trim(line).empty())
        {
            last = line;
        }
    }
    return std::string(trim(last));
}

} // namespace

ExternalSolver::ExternalSolver(const std::filesystem::path& program, std::chrono::milliseconds poll_interval)
    : program_(std::filesystem::absolute(program))
    , poll_interval_(poll_interval)
{
}

SolverRun ExternalSolver::run(const SolverInvocation& invocation) const
{
    // Everything the child needs is prepared before forking: it may only make async-signal-safe calls.
    std::string program = program_.string();
    std::string problem_file = std::filesystem::absolute(invocation.problem_file).string();
    std::string num_runs = std::to_string(invocation.problem.num_runs);
    std::vector<char*> argv{ program.data(), problem_file.data(), num_runs.data(), nullptr };
    const std::string working_directory = program_.parent_path().string();
    const std::filesystem::path output_file = invocation.workspace / "solver_output.txt";

    const int output_fd = ::open(output_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (output_fd == -1)
    {
        return spawnFailure("open the solver output file", errno);
    }
    // Reports a failing exec to the parent. Closed automatically by a successful exec.
    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) == -1)
    {
        const int errnum = errno;
        ::close(output_fd);
        return spawnFailure("create a pipe", errnum);
    }

    const pid_t solver_pid = ::fork();
    if (solver_pid == -1)
    {
        const int errnum = errno;
        ::close(output_fd);
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return spawnFailure("fork the solver", errnum);
    }
    if (solver_pid == 0)
    {
        ::close(exec_pipe[0]);
        int errnum = 0;
        if (::dup2(output_fd, STDOUT_FILENO) == -1 || ::dup2(output_fd, STDERR_FILENO) == -1 || ::chdir(working_directory.c_str()) == -1)
        {
            errnum = errno;
        }
        else
        {
            ::execv(program.c_str(), argv.data());
            errnum = errno;
        }
        [[maybe_unused]] const ssize_t written = ::write(exec_pipe[1], &errnum, sizeof(errnum));
        ::_exit(127);
    }

    ::close(output_fd);
    ::close(exec_pipe[1]);
    int exec_errno = 0;
    ssize_t read_bytes;
    do
    {
        read_bytes = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (read_bytes == -1 && errno == EINTR);
    ::close(exec_pipe[0]);

    int status = 0;
    if (read_bytes == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        ::waitpid(solver_pid, &status, 0);
        return { SolverStatus::SPAWN_FAILED, -1, fmt::format("can't execute {}: {}", program, std::strerror(exec_errno)) };
    }

    spdlog::debug("Started solver (pid {}) for layer {}", solver_pid, invocation.problem.layer_nr);
    const auto deadline = std::chrono::steady_clock::now() + invocation.timeout;
    while (true)
    {
        const pid_t waited = ::waitpid(solver_pid, &status, WNOHANG);
        if (waited == solver_pid)
        {
            break;
        }
        if (waited == -1 && errno != EINTR)
        {
            const int errnum = errno;
            ::kill(solver_pid, SIGKILL);
            return { SolverStatus::SPAWN_FAILED, -1, fmt::format("lost track of the solver process: {}", std::strerror(errnum)) };
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            ::kill(solver_pid, SIGKILL);
            ::waitpid(solver_pid, &status, 0);
            return { SolverStatus::TIMED_OUT, -1, fmt::format("killed after {} ms", invocation.timeout.count()) };
        }
        std::this_thread::sleep_for(poll_interval_);
    }

    if (WIFEXITED(status))
    {
        const int exit_code = WEXITSTATUS(status);
        if (exit_code == 0)
        {
            return { SolverStatus::COMPLETED, 0, "" };
        }
        const std::string last_line = lastOutputLine(output_file);
        return { SolverStatus::NON_ZERO_EXIT, exit_code, last_line.empty() ? fmt::format("exit code {}", exit_code) : fmt::format("exit code {}: {}", exit_code, last_line) };
    }
    const int signal_nr = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
    return { SolverStatus::NON_ZERO_EXIT, 128 + signal_nr, fmt::format("terminated by signal {}", signal_nr) };
}

} // namespace travel
