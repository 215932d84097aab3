#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace composedeck::io {

// Empty when the text is not a YAML document.
std::optional<YAML::Node> decodeYaml(const std::string &text);

// Throws std::runtime_error when the file cannot be read.
std::string readTextFile(const std::filesystem::path &path);

} // namespace composedeck::io
