#include "path_resolver.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace sonora;
using namespace sonora::test;

TEST(PathResolverTest, ResolvesExecutablesOnSearchPath) {
    TempDir dir;
    const auto tool = write_script(dir.path(), "sonora_tool", "exit 0");

    const PathResolver resolver(dir.path().string());

    const auto found = resolver.resolve("sonora_tool");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, std::filesystem::absolute(tool));
    EXPECT_FALSE(resolver.resolve("sonora_no_such_tool").has_value());
}

TEST(PathResolverTest, IgnoresNonExecutableFilesAndDirectories) {
    TempDir dir;
    write_file(dir / "plain.txt", "not a program");
    std::filesystem::create_directory(dir / "subdir");

    const PathResolver resolver(dir.path().string());

    EXPECT_FALSE(resolver.resolve("plain.txt").has_value());
    EXPECT_FALSE(resolver.resolve("subdir").has_value());
    EXPECT_EQ(resolver.size(), 0u);
}

TEST(PathResolverTest, EarlierDirectoryWins) {
    TempDir first;
    TempDir second;
    const auto preferred = write_script(first.path(), "dup_tool", "exit 0");
    write_script(second.path(), "dup_tool", "exit 1");

    const PathResolver resolver(first.path().string() + ":" + second.path().string());

    ASSERT_TRUE(resolver.resolve("dup_tool").has_value());
    EXPECT_EQ(*resolver.resolve("dup_tool"), std::filesystem::absolute(preferred));
}

TEST(PathResolverTest, UnreadableDirectoriesAreSkipped) {
    TempDir dir;
    write_script(dir.path(), "sonora_tool", "exit 0");

    const PathResolver resolver("/nonexistent/sonora/dir::" + dir.path().string());

    EXPECT_TRUE(resolver.resolve("sonora_tool").has_value());
}

TEST(PathResolverTest, RefreshPicksUpNewExecutables) {
    TempDir dir;
    PathResolver resolver(dir.path().string());
    EXPECT_FALSE(resolver.resolve("late_tool").has_value());

    write_script(dir.path(), "late_tool", "exit 0");
    EXPECT_FALSE(resolver.resolve("late_tool").has_value());

    resolver.refresh();
    EXPECT_TRUE(resolver.resolve("late_tool").has_value());
}

TEST(PathResolverTest, DefaultConstructorReadsPathEnvironment) {
    TempDir dir;
    write_script(dir.path(), "env_path_tool", "exit 0");
    const ScopedSearchPath scoped(dir.path());

    const PathResolver resolver;

    EXPECT_TRUE(resolver.resolve("env_path_tool").has_value());
}

TEST(PathResolverTest, NamesWithSeparatorAreCheckedDirectly) {
    TempDir dir;
    const auto tool = write_script(dir.path(), "direct_tool", "exit 0");
    write_file(dir / "data.bin", "x");

    const PathResolver resolver("");

    EXPECT_TRUE(resolver.resolve(tool.string()).has_value());
    EXPECT_FALSE(resolver.resolve((dir / "data.bin").string()).has_value());
    EXPECT_FALSE(resolver.resolve((dir / "missing").string()).has_value());
    EXPECT_FALSE(resolver.resolve("").has_value());
}
