// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/ScopedWorkspace.h"

#include <system_error>

#include <boost/uuid/random_generator.hpp> //For generating a UUID.
#include <boost/uuid/uuid_io.hpp> //For generating a UUID.
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/OptimizerError.h"

namespace travel
{

ScopedWorkspace::ScopedWorkspace(const std::filesystem::path& parent, std::string_view prefix)
    : path_(parent / fmt::format("{}_{}", prefix, boost::uuids::to_string(boost::uuids::random_generator()())))
{
    std::error_code error;
    std::filesystem::create_directories(path_, error);
    if (error)
    {
        if (isResourceExhaustion(error.value()))
        {
            throw ResourceExhaustionError(fmt::format("create {}", path_.string()), error.message());
        }
        throw InputError(fmt::format("Can't create the temporary directory {}: {}", path_.string(), error.message()));
    }
}

ScopedWorkspace::~ScopedWorkspace()
{
    std::error_code error;
    std::filesystem::remove_all(path_, error);
    if (error)
    {
        spdlog::warn("Failed to remove temporary directory {}: {}", path_.string(), error.message());
    }
}

} // namespace travel
