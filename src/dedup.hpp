#pragma once
#include "gamerecord.hpp"
#include <vector>

// All stages keep the first occurrence of a key and preserve input order.

// Within one file: key is (crc, md5, sha1, sha256).
std::vector<RomEntry> dedupRoms(const std::vector<RomEntry>& roms);

// Across files: key is (name, filename, platform).
std::vector<GameData> mergeAndDedup(const std::vector<GameData>& games);

// Before insertion: key is the store's uniqueness key for the profile,
// (filename, hash) or (name, platform, hash).
std::vector<GameRecord> dedupRecords(const std::vector<GameRecord>& records, CatalogProfile profile);
