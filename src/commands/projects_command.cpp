#include "commands/projects_command.hpp"

#include <filesystem>
#include <stdexcept>

#include "commands/options.hpp"
#include "discovery/compose_file_cache.hpp"
#include "discovery/compose_file_scanner.hpp"
#include "discovery/project_matcher.hpp"
#include "io/project_json.hpp"

namespace fs = std::filesystem;

namespace composedeck::commands
{
    namespace
    {

        struct ProjectsOptions
        {
            fs::path livePath;
            int userId = 0;
        };

        bool parseProjectsOptions(const std::vector<std::string> &args, ProjectsOptions &opt, const composedeck::Context &ctx)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--live")
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error("--live requires value");
                        return false;
                    }
                    opt.livePath = args[++i];
                    continue;
                }
                if (arg == "--user")
                {
                    if (i + 1 >= args.size() || !parseInt(args[i + 1], opt.userId))
                    {
                        ctx.error("Invalid --user value");
                        return false;
                    }
                    ++i;
                    continue;
                }
                ctx.error("Unknown projects option: ", arg);
                return false;
            }
            if (opt.livePath.empty())
            {
                ctx.error("projects requires --live FILE");
                return false;
            }
            return true;
        }

        std::string printableActions(const model::ActionMap &actions)
        {
            std::string out;
            for (const auto &[key, allowed] : actions)
            {
                if (!allowed)
                {
                    continue;
                }
                if (!out.empty())
                {
                    out += ",";
                }
                out += key;
            }
            return out.empty() ? "-" : out;
        }

    } // namespace

    int runProjectsCommand(const composedeck::Context &ctx, const std::vector<std::string> &args)
    {
        CommonOptions common;
        if (!parseCommonOptions(args, common, ctx))
        {
            return 1;
        }
        ProjectsOptions opt;
        if (!parseProjectsOptions(common.rest, opt, ctx))
        {
            return 1;
        }

        model::UnifiedView view;
        try
        {
            const DiscoverySettings settings = resolveSettings(common, ctx);
            const discovery::ComposeFileScanner scanner(settings, ctx);
            discovery::ComposeFileCache cache(scanner, ctx);
            const fs::path livePath = opt.livePath;
            discovery::ProjectMatcher matcher(
                cache,
                [livePath](int)
                { return io::loadLiveProjects(livePath); },
                settings,
                ctx);
            view = matcher.getUnifiedProjects(opt.userId);
        }
        catch (const std::exception &e)
        {
            ctx.error("Could not build project list: ", e.what());
            return 1;
        }

        if (common.json)
        {
            ctx.log(io::toJson(view).dump(2));
            return 0;
        }

        ctx.log("Projects:");
        if (view.projects.empty())
        {
            ctx.log("  <none>");
        }
        for (const auto &project : view.projects)
        {
            ctx.log("  ", project.name, "  (", project.state, ")  ",
                    project.definitionFilePath.value_or("<no compose file>"));
            ctx.log("    actions: ", printableActions(project.availableActions));
            if (project.warning.has_value())
            {
                ctx.log("    warning: ", project.warning.value());
            }
        }
        for (const auto &conflict : view.conflicts)
        {
            ctx.warn(conflict.message);
        }
        return 0;
    }

} // namespace composedeck::commands
