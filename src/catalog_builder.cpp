#include "catalog_builder.hpp"
#include "parser_registry.hpp"
#include "catalog_store.hpp"
#include "dedup.hpp"
#include "errors.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <system_error>

CatalogBuilder::CatalogBuilder(CatalogProfile profile)
    : profile(profile) {
    parsers = ParserRegistry::instance().createAll();
}

BaseParser* CatalogBuilder::findParser(const fs::path& path) const {
    for (const auto& parser : parsers) {
        if (parser->match(path))
            return parser.get();
    }
    return nullptr;
}

std::vector<fs::path> CatalogBuilder::collect(const std::vector<fs::path>& inputs) const {
    std::vector<fs::path> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_regular_file(input, ec)) {
            if (findParser(input))
                files.push_back(input);
            else
                Logger::warn("No signature parser for " + input.string());
            continue;
        }
        if (!fs::is_directory(input, ec)) {
            throw IOError("Input " + input.string() + " does not exist");
        }

        Logger::info("Processing directory " + input.string() + "...");
        fs::recursive_directory_iterator it(input, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec) && findParser(it->path()))
                files.push_back(it->path());
        }
        if (ec) {
            throw IOError("Error walking directory " + input.string() + ": " + ec.message());
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    Logger::info("Found " + std::to_string(files.size()) + " signature files");
    return files;
}

std::vector<GameData> CatalogBuilder::parseFile(const fs::path& path, BaseParser& parser) const {
    std::string filename = path.filename().string();

    ParseContext ctx;
    ctx.sourceName = filename;
    ctx.platformHint = platform_from_filename(filename);
    ctx.profile = profile;

    std::vector<uint8_t> blob = readFile(path.string());
    return parser.parse(blob, ctx);
}

std::vector<GameRecord> CatalogBuilder::build(const std::vector<fs::path>& files) {
    std::vector<GameData> allGames;

    for (const auto& path : files) {
        ++stats.filesSeen;
        std::string filename = path.filename().string();
        BaseParser* parser = findParser(path);
        if (!parser) {
            Logger::warn("No signature parser for " + filename);
            ++stats.filesFailed;
            continue;
        }

        Logger::debug("Processing " + filename + " with " + parser->name() + " parser");
        std::vector<GameData> games;
        try {
            games = parseFile(path, *parser);
        } catch (const IOError& e) {
            Logger::error("Error reading " + filename + ": " + e.what());
            ++stats.filesFailed;
            continue;
        } catch (const ParseError& e) {
            Logger::error("Error parsing " + filename + ": " + e.what());
            ++stats.filesFailed;
            continue;
        }

        Logger::info("Parsed " + std::to_string(games.size()) + " games from " + filename);
        stats.gamesParsed += games.size();
        allGames.insert(allGames.end(),
                        std::make_move_iterator(games.begin()),
                        std::make_move_iterator(games.end()));
    }

    std::vector<GameData> merged = mergeAndDedup(allGames);

    // first occurrence in file order wins, grouping by platform comes after
    std::vector<GameRecord> deduped = dedupRecords(toRecords(merged), profile);

    std::map<std::string, std::vector<GameRecord>> byPlatform;
    for (auto& record : deduped) {
        byPlatform[record.platform].push_back(std::move(record));
    }

    std::vector<GameRecord> unique;
    for (auto& entry : byPlatform) {
        unique.insert(unique.end(),
                      std::make_move_iterator(entry.second.begin()),
                      std::make_move_iterator(entry.second.end()));
    }

    stats.perPlatform.clear();
    for (const auto& record : unique) {
        ++stats.perPlatform[record.platform];
    }
    for (const auto& entry : stats.perPlatform) {
        Logger::debug(std::to_string(entry.second) + " records for platform: " + entry.first);
    }
    stats.recordsUnique = unique.size();
    built = unique;
    return unique;
}

BuildSummary CatalogBuilder::run(const std::vector<fs::path>& inputs, CatalogStore& store) {
    stats = BuildSummary();
    auto start = std::chrono::steady_clock::now();

    std::vector<GameRecord> records = build(collect(inputs));

    Logger::info("Inserting " + std::to_string(records.size()) + " records into " +
                 std::to_string(stats.perPlatform.size()) + " platforms");
    stats.rowsInserted = store.bulkInsert(records);

    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    Logger::info("Successfully inserted " + std::to_string(stats.rowsInserted) +
                 " total games into database (" + std::to_string(elapsed) + "ms)");
    return stats;
}
