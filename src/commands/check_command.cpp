#include "commands/check_command.hpp"

#include <optional>
#include <stdexcept>

#include "commands/options.hpp"
#include "discovery/action_classifier.hpp"
#include "discovery/path_validator.hpp"
#include "nlohmann/json.hpp"

using nlohmann::json;

namespace composedeck::commands
{

    int runCheckPathCommand(const composedeck::Context &ctx, const std::vector<std::string> &args)
    {
        CommonOptions opt;
        if (!parseCommonOptions(args, opt, ctx))
        {
            return 1;
        }
        if (opt.rest.size() != 1)
        {
            ctx.error("check-path requires exactly one PATH");
            return 1;
        }

        DiscoverySettings settings;
        try
        {
            settings = resolveSettings(opt, ctx);
        }
        catch (const std::exception &e)
        {
            ctx.error(e.what());
            return 1;
        }

        const discovery::PathValidator validator(settings.rootPath, ctx);
        const bool valid = validator.isValid(opt.rest.front());
        ctx.log(valid ? "valid" : "invalid");
        return valid ? 0 : 1;
    }

    int runActionsCommand(const composedeck::Context &ctx, const std::vector<std::string> &args)
    {
        CommonOptions opt;
        if (!parseCommonOptions(args, opt, ctx))
        {
            return 1;
        }

        bool hasFile = true;
        std::optional<std::string> state;
        for (const auto &arg : opt.rest)
        {
            if (arg == "--no-file")
            {
                hasFile = false;
                continue;
            }
            if (state.has_value())
            {
                ctx.error("actions takes a single STATE");
                return 1;
            }
            state = arg;
        }

        const model::ActionMap actions = discovery::computeActions(hasFile, state);
        if (opt.json)
        {
            json out = json::object();
            for (const auto &[key, allowed] : actions)
            {
                out[key] = allowed;
            }
            ctx.log(out.dump(2));
            return 0;
        }

        ctx.log("state: ", discovery::stateName(discovery::normalizeState(state)),
                hasFile ? "" : " (no compose file)");
        for (const char *key : discovery::kActionKeys)
        {
            ctx.log("  ", key, ": ", actions.at(key) ? "yes" : "no");
        }
        return 0;
    }

    int runClassifyCommand(const composedeck::Context &ctx, const std::vector<std::string> &args)
    {
        CommonOptions opt;
        if (!parseCommonOptions(args, opt, ctx))
        {
            return 1;
        }
        if (opt.rest.size() != 1)
        {
            ctx.error("classify requires exactly one COMMAND");
            return 1;
        }

        const std::string &command = opt.rest.front();
        if (discovery::requiresDefinitionFile(command))
        {
            ctx.log("requires-file");
        }
        else if (discovery::worksWithoutFile(command))
        {
            ctx.log("works-without-file");
        }
        else
        {
            ctx.log("unknown");
        }
        return 0;
    }

} // namespace composedeck::commands
