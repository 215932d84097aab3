#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"

namespace composedeck::commands {

int runProjectsCommand(const composedeck::Context &ctx, const std::vector<std::string> &args);

} // namespace composedeck::commands
