#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "model/project.hpp"

namespace composedeck::discovery {

enum class ProjectState {
    Running,
    Degraded,
    Stopped,
    Paused,
    NotStarted,
    // Containers exist but the runtime reported a state outside the vocabulary.
    Unknown,
};

inline constexpr std::array<const char *, 17> kActionKeys = {
    "up", "create", "build", "pull", "push", "config",
    "start", "stop", "restart", "pause", "unpause",
    "ps", "logs", "top", "down", "rm", "kill"};

inline constexpr std::array<const char *, 8> kRequiresDefinitionFile = {
    "up", "create", "run", "build", "pull", "push", "config", "convert"};

inline constexpr std::array<const char *, 11> kWorksWithoutFile = {
    "start", "stop", "restart", "pause", "unpause", "ps", "logs", "top", "down", "rm", "kill"};

inline constexpr const char *kNotStartedState = "not-started";

// Case-insensitive; null, empty and whitespace mean not-started.
ProjectState normalizeState(const std::optional<std::string> &state);
const char *stateName(ProjectState state);

model::ActionMap computeActions(bool hasFile, const std::optional<std::string> &state);

bool requiresDefinitionFile(const std::string &command);
bool worksWithoutFile(const std::string &command);

// Project state from per-service runtime states.
std::string deriveProjectState(const std::vector<model::ServiceInfo> &services);

} // namespace composedeck::discovery
