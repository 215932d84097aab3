#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "discovery/conflict_resolver.hpp"

using composedeck::discovery::resolveConflicts;
using composedeck::model::DiscoveredFile;
using composedeck::model::DiscoveredFileList;

namespace
{

    composedeck::Context makeContext()
    {
        return composedeck::Context(false);
    }

    DiscoveredFile makeFile(const std::string &name, const std::string &path, bool disabled = false)
    {
        DiscoveredFile file;
        file.projectName = name;
        file.filePath = path;
        file.directoryPath = path.substr(0, path.find_last_of('/'));
        file.isValid = true;
        file.isDisabled = disabled;
        file.services = {"web"};
        return file;
    }

} // namespace

TEST(ConflictResolver, UniqueProjectsPassThroughInOrder)
{
    const auto ctx = makeContext();
    const DiscoveredFileList files = {
        makeFile("zeta", "/c/zeta/docker-compose.yml"),
        makeFile("alpha", "/c/alpha/docker-compose.yml", true),
        makeFile("mid", "/c/mid/docker-compose.yml"),
    };

    const auto result = resolveConflicts(files, ctx);

    ASSERT_EQ(result.resolvedFiles.size(), 3u);
    EXPECT_EQ(result.resolvedFiles[0].projectName, "zeta");
    EXPECT_EQ(result.resolvedFiles[1].projectName, "alpha");
    EXPECT_TRUE(result.resolvedFiles[1].isDisabled);
    EXPECT_EQ(result.resolvedFiles[2].projectName, "mid");
    EXPECT_TRUE(result.conflictErrors.empty());
}

TEST(ConflictResolver, TwoActiveFilesBecomeConflict)
{
    const auto ctx = makeContext();
    const DiscoveredFileList files = {
        makeFile("myapp", "/c/z/docker-compose.yml"),
        makeFile("myapp", "/c/a/docker-compose.yml"),
        makeFile("other", "/c/other/docker-compose.yml"),
    };

    const auto result = resolveConflicts(files, ctx);

    ASSERT_EQ(result.resolvedFiles.size(), 1u);
    EXPECT_EQ(result.resolvedFiles.front().projectName, "other");
    ASSERT_EQ(result.conflictErrors.size(), 1u);

    const auto &error = result.conflictErrors.front();
    EXPECT_EQ(error.projectName, "myapp");
    EXPECT_EQ(error.conflictingFiles, (std::vector<std::string>{"/c/a/docker-compose.yml", "/c/z/docker-compose.yml"}));
    EXPECT_NE(error.message.find("Multiple active"), std::string::npos);
    EXPECT_NE(error.message.find("myapp"), std::string::npos);

    bool mentionsFlag = false;
    for (const auto &step : error.resolutionSteps)
    {
        mentionsFlag = mentionsFlag || step.find("x-disabled") != std::string::npos;
    }
    EXPECT_TRUE(mentionsFlag);
}

TEST(ConflictResolver, ConflictListsDisabledMembersToo)
{
    const auto ctx = makeContext();
    const DiscoveredFileList files = {
        makeFile("myapp", "/c/b/docker-compose.yml"),
        makeFile("myapp", "/c/c/docker-compose.yml", true),
        makeFile("myapp", "/c/a/docker-compose.yml"),
    };

    const auto result = resolveConflicts(files, ctx);

    EXPECT_TRUE(result.resolvedFiles.empty());
    ASSERT_EQ(result.conflictErrors.size(), 1u);
    EXPECT_EQ(result.conflictErrors.front().conflictingFiles.size(), 3u);
    EXPECT_EQ(result.conflictErrors.front().conflictingFiles.front(), "/c/a/docker-compose.yml");
}

TEST(ConflictResolver, SingleActiveAmongDisabledWins)
{
    const auto ctx = makeContext();
    const DiscoveredFileList files = {
        makeFile("myapp", "/c/old/docker-compose.yml", true),
        makeFile("myapp", "/c/new/docker-compose.yml"),
        makeFile("myapp", "/c/older/docker-compose.yml", true),
    };

    const auto result = resolveConflicts(files, ctx);

    ASSERT_EQ(result.resolvedFiles.size(), 1u);
    EXPECT_EQ(result.resolvedFiles.front().filePath, "/c/new/docker-compose.yml");
    EXPECT_TRUE(result.conflictErrors.empty());
}

TEST(ConflictResolver, AllDisabledGroupIsDroppedSilently)
{
    const auto ctx = makeContext();
    const DiscoveredFileList files = {
        makeFile("myapp", "/c/a/docker-compose.yml", true),
        makeFile("myapp", "/c/b/docker-compose.yml", true),
    };

    const auto result = resolveConflicts(files, ctx);

    EXPECT_TRUE(result.resolvedFiles.empty());
    EXPECT_TRUE(result.conflictErrors.empty());
}

TEST(ConflictResolver, GroupingIsCaseSensitive)
{
    const auto ctx = makeContext();
    const DiscoveredFileList files = {
        makeFile("MyApp", "/c/a/docker-compose.yml"),
        makeFile("myapp", "/c/b/docker-compose.yml"),
    };

    const auto result = resolveConflicts(files, ctx);

    EXPECT_EQ(result.resolvedFiles.size(), 2u);
    EXPECT_TRUE(result.conflictErrors.empty());
}

TEST(ConflictResolver, RepeatedCallsDoNotAccumulateErrors)
{
    const auto ctx = makeContext();
    const DiscoveredFileList conflicting = {
        makeFile("myapp", "/c/a/docker-compose.yml"),
        makeFile("myapp", "/c/b/docker-compose.yml"),
    };

    EXPECT_EQ(resolveConflicts(conflicting, ctx).conflictErrors.size(), 1u);
    EXPECT_EQ(resolveConflicts(conflicting, ctx).conflictErrors.size(), 1u);
    EXPECT_TRUE(resolveConflicts({}, ctx).conflictErrors.empty());
}
