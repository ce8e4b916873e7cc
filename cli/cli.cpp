#include "cli.hpp"

#include "cli/commands/cmd_check/check.hpp"
#include "cli/commands/cmd_inspect/inspect.hpp"
#include "cli/commands/common/common.hpp"
#include "utils/logger/logger.hpp"

#include <string>
#include <vector>

namespace IDLX::CLI {

using namespace IDLX::Utils; // For 'Logger'

static constexpr const char* DEFAULT_CONFIG_PATH = "idlx.toml";

static void PrintUsage()
{
    auto& logger = Logger::GetInstance();

    logger.Print("Usage: idlx [--config <idlx.toml>] <command> [args]");
    logger.Print("");
    logger.Print("Commands:");
    logger.Print("  check <manifest.toml>                           Validate every trait in a manifest");
    logger.Print("  inspect <uri|host|publish|subscribe> <template> Parse a single template and show its segments");
}

int RunCli(int argc, const char* const argv[])
{
    auto& logger = Logger::GetInstance();

    std::string              configPath = DEFAULT_CONFIG_PATH;
    std::vector<std::string> args;

    for(int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if(arg == "--config") {
            if(i + 1 >= argc) {
                logger.Error("[IDLX]: '--config' expects a path");
                return 2;
            }
            configPath = argv[++i];
        }
        else if(arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        }
        else
            args.push_back(std::move(arg));
    }

    if(args.empty()) {
        PrintUsage();
        return 2;
    }

    LoadCliSettings(configPath);

    const std::string& command = args[0];

    if(command == "check") {
        if(args.size() != 2) {
            logger.Error("[IDLX]: 'check' expects exactly one manifest path");
            return 2;
        }
        return CheckManifest(args[1]);
    }

    if(command == "inspect") {
        if(args.size() != 3) {
            logger.Error("[IDLX]: 'inspect' expects a dialect and a template");
            return 2;
        }
        return InspectTemplate(args[1], args[2]);
    }

    logger.Error("[IDLX]: Unknown command '", command, "'");
    PrintUsage();
    return 2;
}

} // namespace IDLX::CLI
