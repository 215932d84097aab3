#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"

namespace composedeck::commands {

// Exit codes: 0 clean, 1 failure, 2 conflicts found.
int runScanCommand(const composedeck::Context &ctx, const std::vector<std::string> &args);

} // namespace composedeck::commands
