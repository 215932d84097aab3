#include "discovery/conflict_resolver.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace composedeck::discovery
{

    namespace
    {

        std::string joinPaths(const std::vector<std::string> &paths)
        {
            std::string out;
            for (std::size_t i = 0; i < paths.size(); ++i)
            {
                if (i > 0)
                {
                    out += ", ";
                }
                out += paths[i];
            }
            return out;
        }

        model::ConflictError makeConflictError(const std::string &projectName, std::vector<std::string> paths)
        {
            std::sort(paths.begin(), paths.end());

            model::ConflictError error;
            error.projectName = projectName;
            error.conflictingFiles = std::move(paths);
            error.message = "Multiple active compose files found for project '" + projectName +
                            "'. Mark unused files with 'x-disabled: true'.";
            error.resolutionSteps = {
                "Open each conflicting compose file",
                "Add 'x-disabled: true' at the root level of files you want to ignore",
                "Keep only one file active for project '" + projectName + "'",
                "Wait for the next scan cycle or refresh the discovery cache"};
            return error;
        }

    } // namespace

    model::ResolutionResult resolveConflicts(const model::DiscoveredFileList &files, const composedeck::Context &ctx)
    {
        std::vector<std::string> order;
        std::unordered_map<std::string, std::vector<const model::DiscoveredFile *>> groups;
        for (const auto &file : files)
        {
            auto &group = groups[file.projectName];
            if (group.empty())
            {
                order.push_back(file.projectName);
            }
            group.push_back(&file);
        }

        model::ResolutionResult result;
        for (const auto &projectName : order)
        {
            const auto &group = groups[projectName];
            if (group.size() == 1)
            {
                result.resolvedFiles.push_back(*group.front());
                continue;
            }

            std::vector<const model::DiscoveredFile *> active;
            for (const auto *file : group)
            {
                if (!file->isDisabled)
                {
                    active.push_back(file);
                }
            }

            if (active.size() == 1)
            {
                ctx.debug("Project '", projectName, "' has ", group.size(), " files, using ", active.front()->filePath);
                result.resolvedFiles.push_back(*active.front());
                continue;
            }

            std::vector<std::string> paths;
            paths.reserve(group.size());
            for (const auto *file : group)
            {
                paths.push_back(file->filePath);
            }

            if (active.empty())
            {
                ctx.warn("Project '", projectName, "' has ", group.size(),
                         " files but all are disabled. Project will not be available.");
                continue;
            }

            auto error = makeConflictError(projectName, std::move(paths));
            ctx.error("Project '", projectName, "' has ", active.size(),
                      " active files. Add 'x-disabled: true' to files you want to ignore: ",
                      joinPaths(error.conflictingFiles));
            result.conflictErrors.push_back(std::move(error));
        }

        return result;
    }

} // namespace composedeck::discovery
