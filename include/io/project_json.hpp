#pragma once

#include <filesystem>
#include <vector>

#include "model/project.hpp"
#include "nlohmann/json.hpp"

namespace composedeck::io {

// Reads a runtime snapshot: an array of projects, or an object holding one
// under "projects". Projects without a state get one derived from their
// services. Throws std::runtime_error on unreadable or malformed input.
std::vector<model::LiveProject> loadLiveProjects(const std::filesystem::path &path);
std::vector<model::LiveProject> parseLiveProjects(const nlohmann::json &data);

nlohmann::json toJson(const model::DiscoveredFile &file);
nlohmann::json toJson(const model::ConflictError &conflict);
nlohmann::json toJson(const model::ServiceInfo &service);
nlohmann::json toJson(const model::UnifiedProject &project);
nlohmann::json toJson(const model::UnifiedView &view);

} // namespace composedeck::io
