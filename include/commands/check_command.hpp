#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"

namespace composedeck::commands {

int runCheckPathCommand(const composedeck::Context &ctx, const std::vector<std::string> &args);
int runActionsCommand(const composedeck::Context &ctx, const std::vector<std::string> &args);
int runClassifyCommand(const composedeck::Context &ctx, const std::vector<std::string> &args);

} // namespace composedeck::commands
