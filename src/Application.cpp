// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "Application.h"

#include <chrono>
#include <memory>
#include <string>

#include <boost/uuid/random_generator.hpp> //For generating a UUID.
#include <boost/uuid/uuid_io.hpp> //For generating a UUID.
#include <fmt/format.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dup_filter_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "TravelOptimizer.h"
#include "gcode/UnsupportedCommandLog.h"
#include "routing/ExternalSolver.h"
#include "settings/Config.h"
#include "settings/Settings.h"
#include "settings/SettingsLoader.h"
#include "utils/OptimizerError.h"
#include "utils/ThreadPool.h"
#include "utils/gettime.h"
#include "utils/string.h" //For stringcasecompare.

namespace travel
{

Application::Application()
    : instance_uuid(boost::uuids::to_string(boost::uuids::random_generator()()))
{
    auto dup_sink = std::make_shared<spdlog::sinks::dup_filter_sink_mt>(std::chrono::seconds{ 10 });
    auto base_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    dup_sink->add_sink(base_sink);

    spdlog::default_logger()->sinks()
        = std::vector<std::shared_ptr<spdlog::sinks::sink>>{ dup_sink }; // replace default_logger sinks with the duplicating filtering sink to avoid spamming

    if (auto spdlog_val = spdlog::details::os::getenv("TRAVEL_OPTIMIZER_LOG_LEVEL"); ! spdlog_val.empty())
    {
        spdlog::cfg::helpers::load_levels(spdlog_val);
    };
}

Application::~Application() = default;

Application& Application::getInstance()
{
    static Application instance; // Constructs using the default constructor.
    return instance;
}

void Application::printCall() const
{
    std::string call;
    for (size_t argument_index = 0; argument_index < argc; argument_index++)
    {
        call += fmt::format("{}{}", argument_index == 0 ? "" : " ", argv[argument_index]);
    }
    spdlog::error("Command called: {}", call);
}

void Application::printHelp() const
{
    fmt::print("\n");
    fmt::print("usage:\n");
    fmt::print("TravelOptimizer help\n");
    fmt::print("\tShow this help message\n");
    fmt::print("\n");
    fmt::print("TravelOptimizer <config.json> <input.gcode>\n");
    fmt::print("  <config.json>\n\tThe configuration: a JSON object with the keys\n");
    fmt::print("\t  program                     The route solver to run (required)\n");
    fmt::print("\t  precision                   Scale from millimetres to solver units (required)\n");
    fmt::print("\t  num_runs                    Number of solver runs per layer (required)\n");
    fmt::print("\t  max_merge_length            Merge islands whose entries are closer than this (default 0)\n");
    fmt::print("\t  minimum_nodes               Don't route layers with fewer islands (default 2)\n");
    fmt::print("\t  max_workers                 Maximum number of solvers running at once (default: number of cores)\n");
    fmt::print("\t  timeout                     Seconds a solver may run on one layer (default 60)\n");
    fmt::print("\t  extra_passthrough_commands  Extra G-code commands to accept as state changes\n");
    fmt::print("  <input.gcode>\n\tThe G-code to optimise. The result is written beside it as <name>_optimized.gcode,\n");
    fmt::print("\ttogether with <input>.log, <input>.csv and <input>.unsupported.log.\n");
    fmt::print("\n");
    fmt::print("The log level can be set with the environment variable TRAVEL_OPTIMIZER_LOG_LEVEL, for instance TRAVEL_OPTIMIZER_LOG_LEVEL=debug.\n");
    fmt::print("\n");
}

void Application::printLicense() const
{
    fmt::print("\n");
    fmt::print("TravelOptimizer version {}\n", TRAVEL_OPTIMIZER_VERSION);
    fmt::print("Copyright (C) 2026 UltiMaker\n");
    fmt::print("\n");
    fmt::print("This program is free software: you can redistribute it and/or modify\n");
    fmt::print("it under the terms of the GNU Affero General Public License as published by\n");
    fmt::print("the Free Software Foundation, either version 3 of the License, or\n");
    fmt::print("(at your option) any later version.\n");
    fmt::print("\n");
    fmt::print("This program is distributed in the hope that it will be useful,\n");
    fmt::print("but WITHOUT ANY WARRANTY; without even the implied warranty of\n");
    fmt::print("MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the\n");
    fmt::print("GNU Affero General Public License for more details.\n");
    fmt::print("\n");
    fmt::print("You should have received a copy of the GNU Affero General Public License\n");
    fmt::print("along with this program.  If not, see <http://www.gnu.org/licenses/>.\n");
}

int Application::run(const size_t argc, char** argv)
{
    this->argc = argc;
    this->argv = argv;

    printLicense();

    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    if (stringcasecompare(argv[1], "help") == 0)
    {
        printHelp();
        return 0;
    }
    if (argc != 3)
    {
        spdlog::error("Expected a configuration file and a G-code file");
        printCall();
        printHelp();
        return 1;
    }

    return optimize(argv[1], argv[2]);
}

void Application::startThreadPool(size_t nworkers)
{
    const size_t nthreads = nworkers > 0 ? nworkers - 1 : 0; // Minus one for the main thread
    if (thread_pool && thread_pool->thread_count() == nthreads)
    {
        return; // Keep the previous ThreadPool
    }
    thread_pool = std::make_unique<ThreadPool>(nthreads);
}

void Application::addLogFile(const std::filesystem::path& log_file)
{
    constexpr bool truncate = true;
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), truncate);
    spdlog::default_logger()->sinks().push_back(file_sink);
}

int Application::optimize(const std::filesystem::path& config_file, const std::filesystem::path& input)
{
    TimeKeeper timer;
    Config config;
    try
    {
        const Settings settings = SettingsLoader::loadJSON(config_file);
        config = Config::fromSettings(settings);
    }
    catch (const ConfigError& e)
    {
        spdlog::error("Invalid configuration {}: {}", config_file.string(), e.what());
        return 2;
    }

    try
    {
        TravelOptimizer::validateInput(input);
        std::filesystem::path log_file = input;
        log_file += ".log";
        addLogFile(log_file);
        spdlog::debug("Run {}, solver {}", instance_uuid, config.program.string());

        std::filesystem::path unsupported_file = input;
        unsupported_file += ".unsupported.log";
        const std::shared_ptr<UnsupportedCommandLog> unsupported_log = UnsupportedCommandLog::toFile(unsupported_file);

        startThreadPool(config.max_workers);
        const ExternalSolver solver(config.program);
        TravelOptimizer optimizer(config, solver, *thread_pool);
        optimizer.optimizeFile(input, unsupported_log.get());

        unsupported_log->flush();
        if (const size_t unsupported = unsupported_log->count(); unsupported > 0)
        {
            spdlog::info("{} unsupported lines were passed through unchanged, see {}", unsupported, unsupported_file.string());
        }
    }
    catch (const InputError& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
    catch (const ResourceExhaustionError& e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }
    catch (const spdlog::spdlog_ex& e)
    {
        spdlog::error("Could not open a log file: {}", e.what());
        return 1;
    }

    spdlog::info("Total time elapsed {:.2f}s.", static_cast<double>(timer.total()));
    spdlog::default_logger()->flush();
    return 0;
}

} // namespace travel
