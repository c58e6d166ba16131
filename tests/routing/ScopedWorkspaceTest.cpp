// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/ScopedWorkspace.h" // The file under test.

#include <filesystem>

#include <gtest/gtest.h>

#include "Fixtures.h"
#include "utils/OptimizerError.h"

namespace travel
{

TEST(ScopedWorkspaceTest, CreatesAndRemoves)
{
    std::filesystem::path path;
    {
        const ScopedWorkspace workspace(std::filesystem::temp_directory_path(), "scoped_workspace_test");
        path = workspace.path();
        EXPECT_TRUE(std::filesystem::is_directory(path));
        EXPECT_EQ(path.parent_path(), std::filesystem::temp_directory_path());
        EXPECT_TRUE(path.filename().string().starts_with("scoped_workspace_test_"));

        std::filesystem::create_directory(path / "nested");
        writeTextFile(path / "nested" / "file.txt", "content");
    }
    EXPECT_FALSE(std::filesystem::exists(path)) << "The directory is removed with everything in it.";
}

TEST(ScopedWorkspaceTest, UniqueNames)
{
    const ScopedWorkspace first(std::filesystem::temp_directory_path(), "scoped_workspace_test");
    const ScopedWorkspace second(std::filesystem::temp_directory_path(), "scoped_workspace_test");
    EXPECT_NE(first.path(), second.path());
}

TEST(ScopedWorkspaceTest, UnusableParent)
{
    const ScopedWorkspace parent(std::filesystem::temp_directory_path(), "scoped_workspace_test");
    const std::filesystem::path file = parent.path() / "not_a_directory";
    writeTextFile(file, "");
    EXPECT_THROW(ScopedWorkspace(file, "child"), InputError);
}

} // namespace travel
