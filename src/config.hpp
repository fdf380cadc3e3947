#pragma once
#include "gamerecord.hpp"
#include "logger.hpp"
#include <string>
#include <unordered_map>
#include <vector>

enum class Command {
    None,
    Build,
    Hash,
    Lookup
};

struct Config {
    Command command = Command::None;
    std::string databasePath = "romdig.sqlite";
    CatalogProfile profile = CatalogProfile::Filename;
    std::string jsonFile;           // empty: no JSON export
    LogLevel logLevel = LogLevel::INFO;
    bool showHelp = false;
    std::vector<std::string> inputs;
};

class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    // Throws UsageError on a missing option value or an unknown "-x" flag.
    void parse(int argc, const char* const argv[]);

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical) != 0;
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : def;
    }
};

// Throws UsageError for bad command lines.
Config parseArgs(int argc, const char* const argv[]);

std::string usage();
