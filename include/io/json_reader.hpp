#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

namespace composedeck::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);

} // namespace composedeck::io
