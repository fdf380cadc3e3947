#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Selects the DAT sub-variant and the schema shape for a whole run.
enum class CatalogProfile {
    Filename,   // UNIQUE(filename, hash), rom name required
    Name        // UNIQUE(name, platform, hash), no filename column
};

struct RomEntry {
    std::string name;
    int64_t size = 0;
    std::string crc;
    std::string md5;
    std::string sha1;
    std::string sha256;

    bool hasDigest() const {
        return !crc.empty() || !md5.empty() || !sha1.empty() || !sha256.empty();
    }
};

struct GameData {
    std::string name;
    std::string filename;
    std::string platform;
    std::vector<RomEntry> roms;
};

struct GameRecord {
    std::string name;
    std::string filename;
    std::string platform;
    std::string hash;   // lowercase sha1, may be empty

    bool operator==(const GameRecord& other) const {
        return name == other.name && filename == other.filename &&
               platform == other.platform && hash == other.hash;
    }
};

// One record per ROM, keyed on the ROM's sha1.
std::vector<GameRecord> toRecords(const std::vector<GameData>& games);

std::string profileName(CatalogProfile profile);
CatalogProfile parseProfile(const std::string& text);
