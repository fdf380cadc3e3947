#pragma once
#include "parsers/base_parser.hpp"
#include "gamerecord.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class CatalogStore;

struct BuildSummary {
    size_t filesSeen = 0;
    size_t filesFailed = 0;
    size_t gamesParsed = 0;
    size_t recordsUnique = 0;
    size_t rowsInserted = 0;
    std::map<std::string, size_t> perPlatform;
};

// Signature corpus -> parsers -> dedup -> CatalogStore.
class CatalogBuilder {
public:
    explicit CatalogBuilder(CatalogProfile profile = CatalogProfile::Filename);

    // Signature files under inputs (files or directories, walked
    // recursively), sorted by path.
    std::vector<fs::path> collect(const std::vector<fs::path>& inputs) const;

    // Parses every file; unreadable or malformed files are logged and skipped.
    std::vector<GameRecord> build(const std::vector<fs::path>& files);

    // collect + build + one bulkInsert into an open store.
    BuildSummary run(const std::vector<fs::path>& inputs, CatalogStore& store);

    const BuildSummary& summary() const { return stats; }
    // Records produced by the last build().
    const std::vector<GameRecord>& records() const { return built; }

private:
    BaseParser* findParser(const fs::path& path) const;
    std::vector<GameData> parseFile(const fs::path& path, BaseParser& parser) const;

    CatalogProfile profile;
    std::vector<std::unique_ptr<BaseParser>> parsers;
    BuildSummary stats;
    std::vector<GameRecord> built;
};
