// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef ROUTING_SCOPED_WORKSPACE_H
#define ROUTING_SCOPED_WORKSPACE_H

#include <filesystem>
#include <string_view>

namespace travel
{

/*!
 * \brief A uniquely named temporary directory that is removed with everything in it when this object goes out of
 * scope.
 */
class ScopedWorkspace
{
public:
    /*!
     * Create the directory.
     * \param parent Where to create it.
     * \param prefix Start of the directory name. A random UUID is appended to keep concurrent runs apart.
     * \throws ResourceExhaustionError if the system is out of resources to create the directory.
     * \throws InputError if the directory can't be created for another reason.
     */
    ScopedWorkspace(const std::filesystem::path& parent, std::string_view prefix);
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const
    {
        return path_;
    }

private:
    std::filesystem::path path_;
};

} // namespace travel

#endif // ROUTING_SCOPED_WORKSPACE_H
