#include "gamerecord.hpp"
#include "errors.hpp"
#include "helpers.hpp"

std::vector<GameRecord> toRecords(const std::vector<GameData>& games) {
    std::vector<GameRecord> records;
    for (const auto& game : games) {
        for (const auto& rom : game.roms) {
            GameRecord record;
            record.name = game.name;
            record.filename = game.filename;
            record.platform = game.platform;
            record.hash = to_lower(rom.sha1);
            records.push_back(std::move(record));
        }
    }
    return records;
}

std::string profileName(CatalogProfile profile) {
    switch (profile) {
        case CatalogProfile::Filename: return "filename";
        case CatalogProfile::Name:     return "name";
    }
    return "unknown";
}

CatalogProfile parseProfile(const std::string& text) {
    std::string value = to_lower(trim(text));
    if (value == "filename") return CatalogProfile::Filename;
    if (value == "name") return CatalogProfile::Name;
    throw UsageError("Unknown profile: " + text + " (expected filename or name)");
}
