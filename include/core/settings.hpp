#pragma once

#include <filesystem>
#include <string>

namespace composedeck {

struct DiscoverySettings {
    std::filesystem::path rootPath = "/app/compose-files";
    int scanDepthLimit = 5;
    int cacheDurationSeconds = 10;
    int maxFileSizeKB = 1024;

    // Host directory mounted at rootPath. Runtime-reported paths under it are
    // translated to rootPath before matching. Empty when unused.
    std::string hostPathMapping;
};

std::filesystem::path defaultSettingsPath();

// Throws std::runtime_error when the file cannot be read or holds invalid values.
DiscoverySettings loadSettings(const std::filesystem::path &configPath);

} // namespace composedeck
