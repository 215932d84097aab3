#pragma once

#include "core/context.hpp"
#include "model/project.hpp"

namespace composedeck::discovery {

// Groups files by exact project name. A lone file passes through, a larger
// group yields its single active file. Groups with no active file are dropped
// and groups with several active files become ConflictErrors.
model::ResolutionResult resolveConflicts(const model::DiscoveredFileList &files, const composedeck::Context &ctx);

} // namespace composedeck::discovery
