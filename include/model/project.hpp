#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace composedeck::model {

struct DiscoveredFile {
    std::string filePath;
    std::string projectName;
    std::string directoryPath;
    std::filesystem::file_time_type lastModified{};
    bool isValid = false;
    bool isDisabled = false;
    std::vector<std::string> services;
};

using DiscoveredFileList = std::vector<DiscoveredFile>;

struct ConflictError {
    std::string projectName;
    std::vector<std::string> conflictingFiles;
    std::string message;
    std::vector<std::string> resolutionSteps;
};

struct ResolutionResult {
    DiscoveredFileList resolvedFiles;
    std::vector<ConflictError> conflictErrors;
};

struct ServiceInfo {
    std::string id;
    std::string name;
    std::optional<std::string> image;
    std::string state;
    std::string status;
    std::vector<std::string> ports;
    std::optional<std::string> health;
};

struct LiveProject {
    std::string name;
    std::string path;
    std::string state;
    std::vector<ServiceInfo> services;
    // Definition files as reported by the runtime (host paths).
    std::vector<std::string> configFiles;
};

// Every key of the action vocabulary is always present.
using ActionMap = std::map<std::string, bool>;

struct UnifiedProject {
    std::string name;
    std::string path;
    std::string state;
    bool hasDefinitionFile = false;
    std::optional<std::string> definitionFilePath;
    std::vector<ServiceInfo> services;
    std::optional<std::string> warning;
    ActionMap availableActions;
};

struct UnifiedView {
    std::vector<UnifiedProject> projects;
    std::vector<ConflictError> conflicts;
};

} // namespace composedeck::model
