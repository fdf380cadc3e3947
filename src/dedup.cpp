#include "dedup.hpp"
#include <set>
#include <string>
#include <tuple>

std::vector<RomEntry> dedupRoms(const std::vector<RomEntry>& roms) {
    std::set<std::tuple<std::string, std::string, std::string, std::string>> seen;
    std::vector<RomEntry> unique;
    for (const auto& rom : roms) {
        if (seen.emplace(rom.crc, rom.md5, rom.sha1, rom.sha256).second) {
            unique.push_back(rom);
        }
    }
    return unique;
}

std::vector<GameData> mergeAndDedup(const std::vector<GameData>& games) {
    std::set<std::tuple<std::string, std::string, std::string>> seen;
    std::vector<GameData> unique;
    for (const auto& game : games) {
        if (seen.emplace(game.name, game.filename, game.platform).second) {
            unique.push_back(game);
        }
    }
    return unique;
}

std::vector<GameRecord> dedupRecords(const std::vector<GameRecord>& records, CatalogProfile profile) {
    std::set<std::tuple<std::string, std::string, std::string>> seen;
    std::vector<GameRecord> unique;
    for (const auto& record : records) {
        bool inserted = profile == CatalogProfile::Filename
            ? seen.emplace(record.filename, record.hash, std::string()).second
            : seen.emplace(record.name, record.platform, record.hash).second;
        if (inserted) {
            unique.push_back(record);
        }
    }
    return unique;
}
