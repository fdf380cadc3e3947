#include "base_parser.hpp"
#include "parser_registry.hpp"
#include "dedup.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "cJSON.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Signature export documents:
// { "Name": "...",
//   "SignatureDataObjects": [ { "Name": .., "Year": .., "Platform": .. } ],
//   "Attributes": [ { "attributeName": "ROMs", "Value": [ {..}, .. ] | {..} } ] }
class JSONParser : public BaseParser {
public:
    std::string name() const override { return "JSON"; }

    bool match(const fs::path& path) const override {
        return lower_extension(path) == ".json";
    }

    std::vector<GameData> parse(const std::vector<uint8_t>& blob, const ParseContext& ctx) override;

private:
    static std::string stringItem(const cJSON* object, const char* key);
    static std::vector<std::string> readPlatforms(const cJSON* root);
    static std::vector<const cJSON*> romDescriptors(const cJSON* value);
    static int64_t sizeFromNumber(double value);
    static RomEntry readRom(const cJSON* descriptor);
};

std::string JSONParser::stringItem(const cJSON* object, const char* key) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (cJSON_IsString(item) && item->valuestring)
        return item->valuestring;
    return "";
}

// Distinct non-empty platforms in order of first appearance.
std::vector<std::string> JSONParser::readPlatforms(const cJSON* root) {
    std::vector<std::string> platforms;
    const cJSON* signatures = cJSON_GetObjectItemCaseSensitive(root, "SignatureDataObjects");
    if (!cJSON_IsArray(signatures))
        return platforms;

    const cJSON* signature = nullptr;
    cJSON_ArrayForEach(signature, signatures) {
        std::string platform = stringItem(signature, "Platform");
        if (platform.empty())
            continue;
        if (std::find(platforms.begin(), platforms.end(), platform) == platforms.end())
            platforms.push_back(platform);
    }
    return platforms;
}

// "Value" is either one descriptor object or an array of them.
std::vector<const cJSON*> JSONParser::romDescriptors(const cJSON* value) {
    std::vector<const cJSON*> descriptors;
    if (cJSON_IsObject(value)) {
        descriptors.push_back(value);
    } else if (cJSON_IsArray(value)) {
        const cJSON* element = nullptr;
        cJSON_ArrayForEach(element, value) {
            if (cJSON_IsObject(element))
                descriptors.push_back(element);
        }
    } else {
        Logger::debug("JSON: ROMs value is neither object nor array");
    }
    return descriptors;
}

// Sizes outside int64_t (or inf/nan from cJSON) are recorded as 0.
int64_t JSONParser::sizeFromNumber(double value) {
    const double limit = 9223372036854775808.0;  // 2^63
    if (!std::isfinite(value) || value >= limit || value < -limit)
        return 0;
    return static_cast<int64_t>(value);
}

RomEntry JSONParser::readRom(const cJSON* descriptor) {
    RomEntry rom;
    rom.name = stringItem(descriptor, "Name");
    const cJSON* size = cJSON_GetObjectItemCaseSensitive(descriptor, "Size");
    if (cJSON_IsNumber(size))
        rom.size = sizeFromNumber(size->valuedouble);
    rom.crc = to_lower(stringItem(descriptor, "Crc"));
    rom.md5 = to_lower(stringItem(descriptor, "Md5"));
    rom.sha1 = to_lower(stringItem(descriptor, "Sha1"));
    rom.sha256 = to_lower(stringItem(descriptor, "Sha256"));
    return rom;
}

std::vector<GameData> JSONParser::parse(const std::vector<uint8_t>& blob, const ParseContext& ctx) {
    std::string text(blob.begin(), blob.end());
    std::unique_ptr<cJSON, decltype(&cJSON_Delete)> root(cJSON_Parse(text.c_str()), &cJSON_Delete);
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        std::string context = where ? std::string(where).substr(0, 32) : std::string();
        throw ParseError(ctx.sourceName + ": invalid JSON near '" + context + "'");
    }
    if (!cJSON_IsObject(root.get())) {
        throw ParseError(ctx.sourceName + ": top level is not an object");
    }

    std::string title = stringItem(root.get(), "Name");
    if (title.empty()) {
        throw ParseError(ctx.sourceName + ": document has no Name");
    }

    std::vector<RomEntry> roms;
    const cJSON* attributes = cJSON_GetObjectItemCaseSensitive(root.get(), "Attributes");
    if (cJSON_IsArray(attributes)) {
        const cJSON* attribute = nullptr;
        cJSON_ArrayForEach(attribute, attributes) {
            if (stringItem(attribute, "attributeName") != "ROMs")
                continue;
            const cJSON* value = cJSON_GetObjectItemCaseSensitive(attribute, "Value");
            for (const cJSON* descriptor : romDescriptors(value)) {
                RomEntry rom = readRom(descriptor);
                if (!rom.hasDigest()) {
                    Logger::debug("JSON: " + title + ": dropping ROM without digest '" + rom.name + "'");
                    continue;
                }
                roms.push_back(std::move(rom));
            }
        }
    }
    roms = dedupRoms(roms);

    GameData game;
    game.name = title;
    game.filename = strip_extension(fs::path(ctx.sourceName).filename().string());
    game.roms = roms;

    std::vector<std::string> platforms = readPlatforms(root.get());
    if (platforms.empty()) {
        if (ctx.platformHint.empty())
            throw ParseError(ctx.sourceName + ": no platform could be derived");
        game.platform = ctx.platformHint;
        return {game};
    }

    std::vector<GameData> games;
    for (const auto& platform : platforms) {
        game.platform = platform;
        games.push_back(game);
    }
    if (games.size() > 1) {
        Logger::debug("JSON: " + title + " spans " + std::to_string(games.size()) + " platforms");
    }
    return games;
}

REGISTER_PARSER(JSONParser)
