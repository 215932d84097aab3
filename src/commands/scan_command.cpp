#include "commands/scan_command.hpp"

#include <stdexcept>

#include "commands/options.hpp"
#include "discovery/compose_file_cache.hpp"
#include "discovery/compose_file_scanner.hpp"
#include "discovery/conflict_resolver.hpp"
#include "io/project_json.hpp"

using nlohmann::json;

namespace composedeck::commands
{
    namespace
    {

        std::string joinServices(const std::vector<std::string> &services)
        {
            std::string out;
            for (std::size_t i = 0; i < services.size(); ++i)
            {
                if (i > 0)
                {
                    out += ",";
                }
                out += services[i];
            }
            return out.empty() ? "-" : out;
        }

    } // namespace

    int runScanCommand(const composedeck::Context &ctx, const std::vector<std::string> &args)
    {
        CommonOptions opt;
        if (!parseCommonOptions(args, opt, ctx))
        {
            return 1;
        }

        bool refresh = false;
        for (const auto &arg : opt.rest)
        {
            if (arg == "--refresh")
            {
                refresh = true;
                continue;
            }
            ctx.error("Unknown scan option: ", arg);
            return 1;
        }

        model::ResolutionResult result;
        try
        {
            const DiscoverySettings settings = resolveSettings(opt, ctx);
            const discovery::ComposeFileScanner scanner(settings, ctx);
            discovery::ComposeFileCache cache(scanner, ctx);
            result = discovery::resolveConflicts(cache.getOrScan(refresh), ctx);
        }
        catch (const std::exception &e)
        {
            ctx.error("Scan failed: ", e.what());
            return 1;
        }

        if (opt.json)
        {
            json files = json::array();
            for (const auto &file : result.resolvedFiles)
            {
                files.push_back(io::toJson(file));
            }
            json conflicts = json::array();
            for (const auto &conflict : result.conflictErrors)
            {
                conflicts.push_back(io::toJson(conflict));
            }
            ctx.log(json{{"files", files}, {"conflicts", conflicts}}.dump(2));
        }
        else
        {
            ctx.log("Compose files:");
            if (result.resolvedFiles.empty())
            {
                ctx.log("  <none>");
            }
            for (const auto &file : result.resolvedFiles)
            {
                ctx.log("  ", file.projectName, file.isDisabled ? "  [disabled]" : "", "  [",
                        joinServices(file.services), "]  ", file.filePath);
            }

            if (!result.conflictErrors.empty())
            {
                ctx.log("Conflicts:");
                for (const auto &conflict : result.conflictErrors)
                {
                    ctx.log("  ", conflict.message);
                    for (const auto &file : conflict.conflictingFiles)
                    {
                        ctx.log("    ", file);
                    }
                }
            }
        }

        return result.conflictErrors.empty() ? 0 : 2;
    }

} // namespace composedeck::commands
