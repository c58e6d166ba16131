// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_CONFIG_H
#define SETTINGS_CONFIG_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "settings/Settings.h"
#include "settings/types/Duration.h"

namespace travel
{

/*!
 * \brief The validated configuration of a run. Read-only once loaded.
 */
struct Config
{
    std::filesystem::path program; //!< The solver executable.
    size_t precision = 1000; //!< Scale factor from millimetres to solver coordinates.
    size_t num_runs = 1; //!< How many times the solver repeats its search per layer.
    double max_merge_length = 0.0; //!< Islands with entries closer than this are merged.
    size_t minimum_nodes = 2; //!< Layers with fewer islands aren't solved.
    size_t max_workers = 1; //!< Maximum number of concurrently running solvers.
    Duration timeout = 60.0; //!< Maximum run time of a single solver.
    std::vector<std::string> extra_passthrough_commands; //!< Codes to accept on top of the built-in dialect.

    /*!
     * Read and validate the configuration.
     * \throws ConfigError for a missing required setting, or a setting with an invalid value.
     */
    static Config fromSettings(const Settings& settings);
};

} // namespace travel

#endif // SETTINGS_CONFIG_H
