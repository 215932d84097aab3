#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "commands/check_command.hpp"
#include "commands/projects_command.hpp"
#include "commands/scan_command.hpp"
#include "core/context.hpp"

namespace
{

    constexpr const char *kAppName = "composedeck";
    constexpr const char *kVersion = "1.0.0";

    void printHelp()
    {
        std::cout << kAppName << " " << kVersion << "\n"
                  << "Discovers docker compose projects and reconciles them with the runtime.\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " scan [--refresh] [options]\n"
                  << "  " << kAppName << " projects --live FILE [--user ID] [options]\n"
                  << "  " << kAppName << " check-path PATH [options]\n"
                  << "  " << kAppName << " actions STATE [--no-file] [--json]\n"
                  << "  " << kAppName << " classify COMMAND\n"
                  << "\n"
                  << "Options:\n"
                  << "  --config FILE   settings file (default ./composedeck.json when present)\n"
                  << "  --root DIR      compose root, overrides RootPath\n"
                  << "  --depth N       scan depth, overrides ScanDepthLimit\n"
                  << "  --quiet         no debug output\n"
                  << "  --json          machine readable output\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " scan --root /srv/compose\n"
                  << "  " << kAppName << " projects --live snapshot.json --user 1 --json\n"
                  << "  " << kAppName << " check-path /srv/compose/web/docker-compose.yml --root /srv/compose\n"
                  << "  " << kAppName << " actions exited --no-file\n"
                  << "  " << kAppName << " classify logs\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args = collectArgs(argc, argv, 2);
    const bool quiet = std::any_of(args.begin(), args.end(), [](const std::string &arg)
                                   { return arg == "--quiet" || arg == "-q" || arg == "--json"; });
    const composedeck::Context ctx(!quiet);

    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " " << kVersion << '\n';
        return 0;
    }

    if (command == "scan")
    {
        return composedeck::commands::runScanCommand(ctx, args);
    }
    if (command == "projects")
    {
        return composedeck::commands::runProjectsCommand(ctx, args);
    }
    if (command == "check-path")
    {
        return composedeck::commands::runCheckPathCommand(ctx, args);
    }
    if (command == "actions")
    {
        return composedeck::commands::runActionsCommand(ctx, args);
    }
    if (command == "classify")
    {
        return composedeck::commands::runClassifyCommand(ctx, args);
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
