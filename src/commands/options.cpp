#include "commands/options.hpp"

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace composedeck::commands
{

    bool parseInt(const std::string &text, int &out)
    {
        try
        {
            std::size_t consumed = 0;
            const int value = std::stoi(text, &consumed);
            if (consumed != text.size())
            {
                return false;
            }
            out = value;
            return true;
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    bool parseCommonOptions(const std::vector<std::string> &args, CommonOptions &opt, const composedeck::Context &ctx)
    {
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--config" || arg == "--root" || arg == "--depth")
            {
                if (i + 1 >= args.size())
                {
                    ctx.error(arg, " requires value");
                    return false;
                }
                const std::string &value = args[++i];
                if (arg == "--config")
                {
                    opt.configPath = fs::path(value);
                }
                else if (arg == "--root")
                {
                    opt.root = fs::path(value);
                }
                else
                {
                    int depth = 0;
                    if (!parseInt(value, depth) || depth < 0)
                    {
                        ctx.error("Invalid --depth value: ", value);
                        return false;
                    }
                    opt.depth = depth;
                }
                continue;
            }
            if (arg == "--quiet" || arg == "-q")
            {
                opt.quiet = true;
                continue;
            }
            if (arg == "--json")
            {
                opt.json = true;
                continue;
            }
            opt.rest.push_back(arg);
        }
        return true;
    }

    DiscoverySettings resolveSettings(const CommonOptions &opt, const composedeck::Context &ctx)
    {
        DiscoverySettings settings;
        if (opt.configPath.has_value())
        {
            settings = loadSettings(opt.configPath.value());
            ctx.debug("Loaded settings from ", opt.configPath->string());
        }
        else
        {
            const fs::path fallback = defaultSettingsPath();
            std::error_code ec;
            if (fs::is_regular_file(fallback, ec))
            {
                settings = loadSettings(fallback);
                ctx.debug("Loaded settings from ", fallback.string());
            }
        }

        if (opt.root.has_value())
        {
            settings.rootPath = fs::absolute(opt.root.value());
        }
        if (opt.depth.has_value())
        {
            settings.scanDepthLimit = opt.depth.value();
        }
        return settings;
    }

} // namespace composedeck::commands
