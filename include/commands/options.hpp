#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/settings.hpp"

namespace composedeck::commands {

// Options shared by every command. Anything not recognised here is left in
// rest for the command itself.
struct CommonOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> root;
    std::optional<int> depth;
    bool quiet = false;
    bool json = false;
    std::vector<std::string> rest;
};

bool parseCommonOptions(const std::vector<std::string> &args, CommonOptions &opt, const composedeck::Context &ctx);

// Settings file (explicit or ./composedeck.json when present) plus command
// line overrides. Throws std::runtime_error on invalid configuration.
DiscoverySettings resolveSettings(const CommonOptions &opt, const composedeck::Context &ctx);

bool parseInt(const std::string &text, int &out);

} // namespace composedeck::commands
