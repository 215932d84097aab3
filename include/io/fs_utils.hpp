#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace composedeck::io {

// Raised when the scan root itself cannot be enumerated.
class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

bool isDefinitionFileName(const std::filesystem::path &path);
bool isExcludedDirectory(const std::string &name);

// Recursive walk below root. Files directly in root are depth 0; a directory
// at depthLimit is still listed, nothing deeper is. Throws ScanError when
// root is missing or unreadable.
std::vector<std::filesystem::path> listDefinitionFiles(
    const std::filesystem::path &root,
    int depthLimit,
    const composedeck::Context &ctx
);

} // namespace composedeck::io
