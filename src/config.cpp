#include "config.hpp"
#include "errors.hpp"

void ArgParser::parse(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Is this a known option?
        auto it = optionDefs.find(arg);
        if (it != optionDefs.end()) {
            const auto& info = it->second;

            if (info.takesValue) {
                if (i + 1 >= argc) {
                    throw UsageError("Missing value for option: " + arg);
                }
                parsedOptions[info.canonicalName] = argv[++i];
            } else {
                parsedOptions[info.canonicalName] = "true";
            }
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        }
        else {
            // Not an option → positional argument
            positional.push_back(arg);
        }
    }
}

std::string usage() {
    return "Usage: romdig <command> [options] <args>\n"
           "Commands:\n"
           "  build <dir|file>...   Rebuild the catalog from DAT/JSON signature files\n"
           "  hash <file>...        Print the catalog hash of ROM files (zip/gz/xz: first entry)\n"
           "  lookup <file|sha1>    Identify a ROM file or hash against the catalog\n"
           "Options:\n"
           "  -o FILE   Database file (default romdig.sqlite)\n"
           "  -p NAME   Catalog profile for build: filename (default) or name\n"
           "  -O FILE   Also write the built or matched records as JSON\n"
           "  -d        Enable Debug mode\n"
           "  -q        Only report errors\n"
           "  -h        Show this help message\n";
}

Config parseArgs(int argc, const char* const argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-q", false, "quiet");
    args.addOption("--quiet", false, "quiet");

    args.addOption("-o", true, "database");
    args.addOption("--database", true, "database");

    args.addOption("-p", true, "profile");
    args.addOption("--profile", true, "profile");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.parse(argc, argv);

    if (args.has("debug"))
    {
        config.logLevel = LogLevel::DEBUG;
    }
    else if (args.has("quiet"))
    {
        config.logLevel = LogLevel::ERROR;
    }

    if (args.has("database"))
    {
        config.databasePath = args.get("database");
    }

    if (args.has("profile"))
    {
        config.profile = parseProfile(args.get("profile"));
    }

    if (args.has("jsonPath"))
    {
        config.jsonFile = args.get("jsonPath");
    }

    if (args.has("help") || args.positional.empty())
    {
        config.showHelp = true;
        return config;
    }

    const std::string& command = args.positional.front();
    if (command == "build")
        config.command = Command::Build;
    else if (command == "hash")
        config.command = Command::Hash;
    else if (command == "lookup")
        config.command = Command::Lookup;
    else
        throw UsageError("Unknown command: " + command);

    config.inputs.assign(args.positional.begin() + 1, args.positional.end());
    if (config.inputs.empty())
    {
        throw UsageError("Missing arguments for " + command);
    }
    if (config.command == Command::Lookup && config.inputs.size() != 1)
    {
        throw UsageError("lookup takes exactly one file or hash");
    }

    return config;
}
