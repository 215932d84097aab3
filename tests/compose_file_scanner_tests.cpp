#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "discovery/compose_file_scanner.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;
using composedeck::discovery::ComposeFileScanner;

namespace
{

    composedeck::Context makeContext()
    {
        return composedeck::Context(false);
    }

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path root = fs::temp_directory_path() / ("composedeck_scan_test_" + name + "_" + std::to_string(now));
        fs::create_directories(root);
        return root;
    }

    void writeFile(const fs::path &path, const std::string &content)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    composedeck::DiscoverySettings settingsFor(const fs::path &root)
    {
        composedeck::DiscoverySettings settings;
        settings.rootPath = root;
        return settings;
    }

    const composedeck::model::DiscoveredFile *findByName(
        const composedeck::model::DiscoveredFileList &files,
        const std::string &name)
    {
        auto it = std::find_if(files.begin(), files.end(), [&](const auto &file)
                               { return file.projectName == name; });
        return it == files.end() ? nullptr : &*it;
    }

    constexpr const char *kSimpleCompose = "services:\n  web:\n    image: nginx\n";

} // namespace

TEST(ComposeFileScanner, NonStandardFileNamesArePrefixedWithDirectory)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("pterodactyl");
    writeFile(root / "pterodactyl" / "panel.yml", "services:\n  panel:\n    image: ghcr.io/pterodactyl/panel\n");
    writeFile(root / "pterodactyl" / "wings.yml", "services:\n  wings:\n    image: ghcr.io/pterodactyl/wings\n");

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 2u);
    const auto *panel = findByName(files, "pterodactyl-panel");
    const auto *wings = findByName(files, "pterodactyl-wings");
    ASSERT_NE(panel, nullptr);
    ASSERT_NE(wings, nullptr);
    EXPECT_EQ(panel->services, std::vector<std::string>{"panel"});
    EXPECT_EQ(panel->directoryPath, (root / "pterodactyl").string());
    EXPECT_TRUE(panel->isValid);
    EXPECT_FALSE(panel->isDisabled);

    cleanupTemp(root);
}

TEST(ComposeFileScanner, CanonicalFileNameUsesDirectoryName)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("canonical");
    writeFile(root / "blog" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "shop" / "compose.yaml", kSimpleCompose);
    writeFile(root / "wiki" / "wiki.yml", kSimpleCompose);

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 3u);
    EXPECT_NE(findByName(files, "blog"), nullptr);
    EXPECT_NE(findByName(files, "shop"), nullptr);
    EXPECT_NE(findByName(files, "wiki"), nullptr);

    cleanupTemp(root);
}

TEST(ComposeFileScanner, ExplicitNameWinsOverPathDerivedName)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("explicit");
    writeFile(root / "stack" / "docker-compose.yml", "name: mystack\nservices:\n  db:\n    image: postgres\n  cache:\n    image: redis\n");
    writeFile(root / "other" / "docker-compose.yml", "name: \"  \"\nservices:\n  app:\n    image: alpine\n");

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 2u);
    const auto *stack = findByName(files, "mystack");
    ASSERT_NE(stack, nullptr);
    EXPECT_EQ(stack->services, (std::vector<std::string>{"db", "cache"}));
    EXPECT_NE(findByName(files, "other"), nullptr);

    cleanupTemp(root);
}

TEST(ComposeFileScanner, FilesWithoutServicesOrInvalidYamlAreExcluded)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("invalid");
    writeFile(root / "empty" / "docker-compose.yml", "services: {}\n");
    writeFile(root / "none" / "docker-compose.yml", "version: '3'\nvolumes:\n  data: {}\n");
    writeFile(root / "broken" / "docker-compose.yml", "services:\n  web: [unclosed\n");
    writeFile(root / "list" / "docker-compose.yml", "- a\n- b\n");
    writeFile(root / "blank" / "docker-compose.yml", "");
    writeFile(root / "good" / "docker-compose.yml", kSimpleCompose);

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.front().projectName, "good");

    cleanupTemp(root);
}

TEST(ComposeFileScanner, OnlyTrueMarksFileDisabled)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("disabled");
    writeFile(root / "a" / "docker-compose.yml", std::string("x-disabled: true\n") + kSimpleCompose);
    writeFile(root / "b" / "docker-compose.yml", std::string("x-disabled: \"true\"\n") + kSimpleCompose);
    writeFile(root / "c" / "docker-compose.yml", std::string("x-disabled: false\n") + kSimpleCompose);
    writeFile(root / "d" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "e" / "docker-compose.yml", std::string("x-disabled: TRUE\n") + kSimpleCompose);
    writeFile(root / "f" / "docker-compose.yml", std::string("x-disabled: yes\n") + kSimpleCompose);
    writeFile(root / "g" / "docker-compose.yml", std::string("x-disabled: on\n") + kSimpleCompose);

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 7u);
    EXPECT_TRUE(findByName(files, "a")->isDisabled);
    EXPECT_TRUE(findByName(files, "b")->isDisabled);
    EXPECT_FALSE(findByName(files, "c")->isDisabled);
    EXPECT_FALSE(findByName(files, "d")->isDisabled);
    EXPECT_TRUE(findByName(files, "e")->isDisabled);
    EXPECT_FALSE(findByName(files, "f")->isDisabled);
    EXPECT_FALSE(findByName(files, "g")->isDisabled);

    cleanupTemp(root);
}

TEST(ComposeFileScanner, VariablePlaceholdersDoNotBreakParsing)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("placeholders");
    writeFile(root / "app" / "docker-compose.yml",
              "services:\n"
              "  api:\n"
              "    image: ${REGISTRY:-docker.io}/api:${TAG}\n"
              "    ports:\n"
              "      - \"${PORT:-8080}:80\"\n");

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.front().services, std::vector<std::string>{"api"});

    cleanupTemp(root);
}

TEST(ComposeFileScanner, DepthLimitIncludesBoundaryDirectory)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("depth");
    writeFile(root / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "one" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "one" / "two" / "docker-compose.yml", kSimpleCompose);

    auto settings = settingsFor(root);
    settings.scanDepthLimit = 1;
    const ComposeFileScanner scanner(settings, ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 2u);
    EXPECT_NE(findByName(files, "one"), nullptr);
    EXPECT_EQ(findByName(files, "two"), nullptr);

    settings.scanDepthLimit = 0;
    const ComposeFileScanner rootOnly(settings, ctx);
    EXPECT_EQ(rootOnly.scan().size(), 1u);

    cleanupTemp(root);
}

TEST(ComposeFileScanner, SkipsExcludedDirectoriesAndOtherExtensions)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("excluded");
    writeFile(root / "node_modules" / "pkg" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "Node_Modules" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / ".git" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "app" / "build" / "docker-compose.yml", kSimpleCompose);
    writeFile(root / "app" / "docker-compose.json", kSimpleCompose);
    writeFile(root / "app" / "Docker-Compose.YML", kSimpleCompose);

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.front().projectName, "app");
    EXPECT_TRUE(composedeck::io::isExcludedDirectory("VENDOR"));
    EXPECT_FALSE(composedeck::io::isExcludedDirectory("vendors"));

    cleanupTemp(root);
}

TEST(ComposeFileScanner, OversizedFilesAreSkipped)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("size");
    std::string big = kSimpleCompose;
    big += "x-padding: \"" + std::string(2048, 'p') + "\"\n";
    writeFile(root / "big" / "docker-compose.yml", big);
    writeFile(root / "small" / "docker-compose.yml", kSimpleCompose);

    auto settings = settingsFor(root);
    settings.maxFileSizeKB = 1;
    const ComposeFileScanner scanner(settings, ctx);
    const auto files = scanner.scan();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.front().projectName, "small");

    cleanupTemp(root);
}

TEST(ComposeFileScanner, MissingRootThrowsScanError)
{
    const auto ctx = makeContext();
    const fs::path root = makeTempRoot("missing") / "does-not-exist";

    const ComposeFileScanner scanner(settingsFor(root), ctx);
    EXPECT_THROW(scanner.scan(), composedeck::io::ScanError);

    cleanupTemp(root.parent_path());
}

TEST(ComposeFileScanner, DefaultProjectNameRules)
{
    using composedeck::discovery::defaultProjectName;
    EXPECT_EQ(defaultProjectName("/srv/blog/docker-compose.yml"), "blog");
    EXPECT_EQ(defaultProjectName("/srv/blog/COMPOSE.YAML"), "blog");
    EXPECT_EQ(defaultProjectName("/srv/blog/Blog.yml"), "blog");
    EXPECT_EQ(defaultProjectName("/srv/blog/prod.yml"), "blog-prod");
    EXPECT_EQ(defaultProjectName("stack.yml"), "stack");
}
