// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef UTILS_OPTIMIZER_ERROR_H
#define UTILS_OPTIMIZER_ERROR_H

#include <fmt/format.h>

#include <cerrno>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace travel
{

/*!
 * \brief The kinds of failure the optimizer distinguishes.
 *
 * Parse, solver invocation and tour validation errors are confined to a single line or layer and are recovered from.
 * Configuration, input and resource exhaustion errors affect the whole run and abort it.
 */
enum class ErrorKind
{
    PARSE,
    CONFIG,
    INPUT,
    SOLVER_INVOCATION,
    TOUR_VALIDATION,
    RESOURCE_EXHAUSTION,
};

[[nodiscard]] constexpr std::string_view toString(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::PARSE:
        return "parse error";
    case ErrorKind::CONFIG:
        return "configuration error";
    case ErrorKind::INPUT:
        return "input error";
    case ErrorKind::SOLVER_INVOCATION:
        return "solver invocation error";
    case ErrorKind::TOUR_VALIDATION:
        return "tour validation error";
    case ErrorKind::RESOURCE_EXHAUSTION:
        return "resource exhaustion";
    }
    return "unknown error";
}

class OptimizerError : public std::exception
{
    ErrorKind kind_;
    std::string msg_;

public:
    OptimizerError(const ErrorKind kind, std::string message) noexcept
        : kind_(kind)
        , msg_(std::move(message))
    {
    }

    [[nodiscard]] ErrorKind kind() const noexcept
    {
        return kind_;
    }

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class ParseError : public OptimizerError
{
public:
    ParseError(const size_t line_nr, std::string_view reason) noexcept
        : OptimizerError(ErrorKind::PARSE, fmt::format("Line {}: {}", line_nr, reason))
    {
    }
};

class ConfigError : public OptimizerError
{
public:
    explicit ConfigError(std::string message) noexcept
        : OptimizerError(ErrorKind::CONFIG, std::move(message))
    {
    }

    ConfigError(std::string_view key, std::string_view reason) noexcept
        : OptimizerError(ErrorKind::CONFIG, fmt::format("Setting '{}': {}", key, reason))
    {
    }
};

class InputError : public OptimizerError
{
public:
    explicit InputError(std::string message) noexcept
        : OptimizerError(ErrorKind::INPUT, std::move(message))
    {
    }
};

class SolverInvocationError : public OptimizerError
{
public:
    SolverInvocationError(const size_t layer_nr, std::string_view reason) noexcept
        : OptimizerError(ErrorKind::SOLVER_INVOCATION, fmt::format("Solver failed on layer {}: {}", layer_nr, reason))
    {
    }
};

class TourValidationError : public OptimizerError
{
public:
    explicit TourValidationError(std::string_view reason) noexcept
        : OptimizerError(ErrorKind::TOUR_VALIDATION, fmt::format("Invalid tour: {}", reason))
    {
    }
};

/*!
 * Raised when the operating system refuses a file handle, a process or memory. Carries the OS's own message.
 */
class ResourceExhaustionError : public OptimizerError
{
public:
    ResourceExhaustionError(std::string_view operation, std::string_view os_message) noexcept
        : OptimizerError(ErrorKind::RESOURCE_EXHAUSTION, fmt::format("Out of system resources while trying to {}: {}", operation, os_message))
    {
    }
};

/*!
 * Whether an errno value means the system ran out of file handles, processes or memory.
 */
[[nodiscard]] inline bool isResourceExhaustion(const int errnum)
{
    return errnum == EMFILE || errnum == ENFILE || errnum == EAGAIN || errnum == ENOMEM;
}

} // namespace travel

#endif // UTILS_OPTIMIZER_ERROR_H
