#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>
#include "gamerecord.hpp"

namespace fs = std::filesystem;

struct ParseContext {
    std::string platformHint;   // usually platform_from_filename(sourceName)
    std::string sourceName;     // base name of the signature file
    CatalogProfile profile = CatalogProfile::Filename;
};

class BaseParser {
public:
    virtual ~BaseParser() = default;
    virtual std::string name() const = 0;
    virtual bool match(const fs::path& path) const = 0;
    // Throws ParseError when nothing usable could be read from blob.
    virtual std::vector<GameData> parse(const std::vector<std::uint8_t>& blob, const ParseContext& ctx) = 0;

};
