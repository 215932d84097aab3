#pragma once

#include <filesystem>
#include <string>

#include "core/context.hpp"

namespace composedeck::discovery {

#if defined(_WIN32) || defined(__APPLE__)
inline constexpr bool kCaseInsensitiveFs = true;
#else
inline constexpr bool kCaseInsensitiveFs = false;
#endif

// Confines user-supplied paths to the configured compose root.
class PathValidator {
public:
    PathValidator(std::filesystem::path root, const composedeck::Context &ctx);

    // Never throws. Relative paths resolve against the working directory.
    bool isValid(const std::string &path) const;

    const std::filesystem::path &root() const { return root_; }

private:
    std::filesystem::path root_;
    const composedeck::Context &ctx_;
};

// Component-wise containment of two already normalised paths.
bool isWithinRoot(const std::filesystem::path &candidate, const std::filesystem::path &root, bool ignoreCase);

} // namespace composedeck::discovery
