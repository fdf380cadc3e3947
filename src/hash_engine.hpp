#pragma once
#include "extractors/base_extractor.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Computes the catalog's content fingerprint (lowercase hex SHA-1) of a ROM.
// Archives (.zip, .gz, .xz) are fingerprinted through their first member.
class HashEngine {
public:
    HashEngine();

    // Throws IOError, ArchiveOpenError, EmptyArchiveError or EntryOpenError.
    std::string fingerprint(const fs::path& filePath);

    // Name of the extractor handling filePath, empty for plain files.
    std::string archiveType(const fs::path& filePath) const;

private:
    BaseExtractor* findExtractor(const fs::path& filePath) const;
    std::string hashPlainFile(const fs::path& filePath);

    std::vector<std::unique_ptr<BaseExtractor>> extractors;
};
