#pragma once

#include <filesystem>
#include <optional>

#include "core/context.hpp"
#include "core/settings.hpp"
#include "model/project.hpp"

namespace composedeck::discovery {

// Finds compose definition files below DiscoverySettings::rootPath.
class ComposeFileScanner {
public:
    ComposeFileScanner(DiscoverySettings settings, const composedeck::Context &ctx);

    // Throws io::ScanError when the root cannot be enumerated. Files that
    // fail to parse are left out of the result.
    model::DiscoveredFileList scan() const;

    // Empty when the file is oversized, unreadable, not YAML, or declares
    // no services.
    std::optional<model::DiscoveredFile> parseOne(const std::filesystem::path &file) const;

    const DiscoverySettings &settings() const { return settings_; }

private:
    DiscoverySettings settings_;
    const composedeck::Context &ctx_;
};

std::string defaultProjectName(const std::filesystem::path &file);

} // namespace composedeck::discovery
