#include "catalog_builder.hpp"
#include "catalog_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "hash_engine.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "utils/printer.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static int runBuild(const Config& config) {
    CatalogStore store;
    store.open(config.databasePath, config.profile, OpenMode::Create);

    CatalogBuilder builder(config.profile);
    BuildSummary summary = builder.run(
        std::vector<fs::path>(config.inputs.begin(), config.inputs.end()), store);
    printBuildSummary(summary);

    if (!config.jsonFile.empty())
        dumpJson(builder.records(), config.jsonFile);
    return 0;
}

static int runHash(const Config& config) {
    HashEngine engine;
    int status = 0;
    for (const auto& input : config.inputs) {
        try {
            std::string type = engine.archiveType(input);
            Logger::debug(input + ": " + (type.empty() ? "plain file" : type + " first entry"));
            printHash(engine.fingerprint(input), input);
        } catch (const RomdigError& e) {
            Logger::error(e.what());
            status = 1;
        }
    }
    return status;
}

static int runLookup(const Config& config) {
    CatalogStore store;
    store.open(config.databasePath, config.profile, OpenMode::ReadOnly);

    const std::string& query = config.inputs.front();
    std::optional<GameRecord> match;
    // a path that cannot be stat'ed is not a file; fingerprint reports it
    std::error_code ec;
    bool isFile = fs::exists(query, ec);
    if (!isFile && is_hex_digest(query, 40)) {
        match = store.lookupByHash(query);
    } else {
        HashEngine engine;
        std::string hash = engine.fingerprint(query);
        Logger::debug("SHA1 " + hash);
        match = store.lookupByHash(hash);
        if (!match) {
            Logger::debug("No hash match, trying filename");
            match = store.lookupByFilename(fs::path(query).filename().string());
        }
    }

    printLookup(match, query);
    if (match && !config.jsonFile.empty())
        dumpJson({*match}, config.jsonFile);
    return match ? 0 : 1;
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        Logger::error(e.what());
        std::cerr << usage();
        return 2;
    }

    if (config.showHelp) {
        std::cout << usage();
        return 0;
    }
    Logger::setLevel(config.logLevel);
    Logger::debug("romdig, " + profileName(config.profile) + " profile");

    try {
        switch (config.command) {
            case Command::Build:  return runBuild(config);
            case Command::Hash:   return runHash(config);
            case Command::Lookup: return runLookup(config);
            case Command::None:   break;
        }
    } catch (const RomdigError& e) {
        Logger::error(e.what());
        return 1;
    }
    std::cerr << usage();
    return 2;
}
