// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "settings/Config.h"

#include <unistd.h>

#include <algorithm>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/OptimizerError.h"

namespace travel
{

Config Config::fromSettings(const Settings& settings)
{
    Config config;

    config.program = settings.get<std::filesystem::path>("program");
    std::error_code error;
    if (! std::filesystem::is_regular_file(config.program, error))
    {
        throw ConfigError("program", fmt::format("{} does not exist or is not a file", config.program.string()));
    }
    if (::access(config.program.c_str(), X_OK) != 0)
    {
        throw ConfigError("program", fmt::format("{} is not executable", config.program.string()));
    }

    config.precision = settings.get<size_t>("precision");
    if (config.precision == 0)
    {
        throw ConfigError("precision", "must be greater than 0");
    }
    config.num_runs = settings.get<size_t>("num_runs");
    if (config.num_runs == 0)
    {
        throw ConfigError("num_runs", "must be greater than 0");
    }

    config.max_merge_length = settings.get<double>("max_merge_length", 0.0);
    if (config.max_merge_length < 0.0)
    {
        throw ConfigError("max_merge_length", "can't be negative");
    }

    config.minimum_nodes = settings.get<size_t>("minimum_nodes", size_t{ 2 });
    if (config.minimum_nodes < 2)
    {
        throw ConfigError("minimum_nodes", "must be at least 2");
    }

    config.max_workers = settings.get<size_t>("max_workers", size_t{ std::max(std::thread::hardware_concurrency(), 1U) });
    if (config.max_workers == 0)
    {
        throw ConfigError("max_workers", "must be at least 1");
    }

    if (settings.has("timeout") && settings.get<double>("timeout") <= 0.0)
    {
        throw ConfigError("timeout", "must be greater than 0");
    }
    config.timeout = settings.get<Duration>("timeout", Duration(60.0));

    config.extra_passthrough_commands = settings.get<std::vector<std::string>>("extra_passthrough_commands", std::vector<std::string>{});

    spdlog::debug("Configuration:{}", settings.getAllSettingsString());
    return config;
}

} // namespace travel
