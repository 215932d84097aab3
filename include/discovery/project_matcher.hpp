#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/settings.hpp"
#include "model/project.hpp"

namespace composedeck::discovery {

class ComposeFileCache;

// Supplies the live projects visible to a user. Results are already
// permission-filtered; exceptions propagate to the caller of
// ProjectMatcher::getUnifiedProjects.
using RuntimeProvider = std::function<std::vector<model::LiveProject>(int userId)>;

class ProjectMatcher {
public:
    ProjectMatcher(
        ComposeFileCache &cache,
        RuntimeProvider provider,
        DiscoverySettings settings,
        const composedeck::Context &ctx
    );

    // Live projects first, in provider order, followed by not-started
    // projects that only exist on disk.
    model::UnifiedView getUnifiedProjects(int userId) const;

    // Maps a runtime-reported host path to the matching path under rootPath.
    std::optional<std::string> toContainerPath(const std::string &hostPath) const;

private:
    ComposeFileCache &cache_;
    RuntimeProvider provider_;
    DiscoverySettings settings_;
    const composedeck::Context &ctx_;
};

} // namespace composedeck::discovery
