#include "base_parser.hpp"
#include "parser_registry.hpp"
#include "dat_tokenizer.hpp"
#include "dedup.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

// clrmamepro DAT grammar:
//   clrmamepro ( name "Nintendo - Game Boy" ... )
//   game ( name "Title" ... rom ( name file.gb size 32768 crc .. sha1 .. ) )
class DATParser : public BaseParser {
public:
    std::string name() const override { return "DAT"; }
    bool match(const fs::path& path) const override;
    std::vector<GameData> parse(const std::vector<uint8_t>& blob, const ParseContext& ctx) override;

private:
    static constexpr int kMaxNesting = 32;

    bool readList(DatTokenizer& tok, DatClause& parent, int depth, std::string& error);
    void extractGames(const DatClause& block, const std::string& platform,
                      CatalogProfile profile, std::vector<GameData>& out);
    static bool isBlockKeyword(const std::string& key);
};

bool DATParser::match(const fs::path& path) const {
    return lower_extension(path) == ".dat";
}

bool DATParser::isBlockKeyword(const std::string& key) {
    return key == "game" || key == "machine" || key == "resource";
}

// Reads clauses up to the ')' closing parent. On failure the tokenizer is
// left where top-level parsing can resume.
bool DATParser::readList(DatTokenizer& tok, DatClause& parent, int depth, std::string& error) {
    if (depth > kMaxNesting) {
        error = "nesting deeper than " + std::to_string(kMaxNesting) + " levels at line " +
                std::to_string(tok.line());
        return false;
    }
    while (true) {
        DatToken t = tok.next();
        switch (t.kind) {
            case DatTokenKind::Close:
                return true;
            case DatTokenKind::End:
                error = "unexpected end of file inside '" + parent.key + "'";
                return false;
            case DatTokenKind::Open: {
                DatClause anonymous;
                anonymous.isList = true;
                anonymous.line = t.line;
                if (!readList(tok, anonymous, depth + 1, error))
                    return false;
                Logger::debug("DAT: anonymous list at line " + std::to_string(t.line));
                break;
            }
            case DatTokenKind::Quoted:
                Logger::debug("DAT: stray string \"" + t.text + "\" at line " + std::to_string(t.line));
                break;
            case DatTokenKind::Word: {
                if (isBlockKeyword(t.text) && tok.peek().kind == DatTokenKind::Open) {
                    error = "'" + parent.key + "' opened at line " + std::to_string(parent.line) +
                            " is not closed before '" + t.text + "' at line " + std::to_string(t.line);
                    tok.pushBack(t);
                    return false;
                }

                DatClause clause;
                clause.key = t.text;
                clause.line = t.line;

                DatToken v = tok.next();
                if (v.kind == DatTokenKind::Open) {
                    clause.isList = true;
                    if (!readList(tok, clause, depth + 1, error))
                        return false;
                } else if (v.kind == DatTokenKind::Quoted || v.kind == DatTokenKind::Word) {
                    clause.value = v.text;
                    clause.quoted = v.kind == DatTokenKind::Quoted;
                } else if (v.kind == DatTokenKind::Close) {
                    parent.children.push_back(std::move(clause));
                    return true;
                } else {
                    error = "unexpected end of file after '" + t.text + "'";
                    return false;
                }
                parent.children.push_back(std::move(clause));
                break;
            }
        }
    }
}

void DATParser::extractGames(const DatClause& block, const std::string& platform,
                             CatalogProfile profile, std::vector<GameData>& out) {
    const DatClause* title = block.find("name");
    if (!title || title->isList || title->value.empty()) {
        Logger::debug("DAT: block at line " + std::to_string(block.line) + " has no name");
        return;
    }

    std::vector<RomEntry> roms;
    for (const auto& rom : block.children) {
        if (rom.key != "rom" || !rom.isList)
            continue;

        const DatClause* sha1 = rom.find("sha1");
        if (!sha1 || !is_hex_digest(sha1->value, 40)) {
            Logger::debug("DAT: " + title->value + ": rom without sha1");
            continue;
        }

        RomEntry entry;
        const DatClause* romName = rom.find("name");
        if (profile == CatalogProfile::Filename) {
            if (!romName || romName->isList) {
                Logger::debug("DAT: " + title->value + ": rom without name");
                continue;
            }
            entry.name = romName->value;
            // unterminated quote in the source, keep the record without a filename
            if (!romName->quoted && !entry.name.empty() && entry.name[0] == '"') {
                Logger::debug("DAT: malformed rom name " + entry.name + " at line " +
                              std::to_string(romName->line));
                entry.name.clear();
            }
        } else if (romName && !romName->isList) {
            entry.name = romName->value;
        }

        if (const DatClause* size = rom.find("size"))
            entry.size = std::strtoll(size->value.c_str(), nullptr, 10);
        if (const DatClause* crc = rom.find("crc"))
            entry.crc = to_lower(crc->value);
        if (const DatClause* md5 = rom.find("md5"))
            entry.md5 = to_lower(md5->value);
        if (const DatClause* sha256 = rom.find("sha256"))
            entry.sha256 = to_lower(sha256->value);
        entry.sha1 = to_lower(sha1->value);

        roms.push_back(std::move(entry));
    }

    if (roms.empty())
        return;

    // filename profile: one game per rom file, name profile: one per block
    if (profile == CatalogProfile::Filename) {
        for (auto& rom : roms) {
            GameData game;
            game.name = title->value;
            game.filename = rom.name;
            game.platform = platform;
            game.roms.push_back(std::move(rom));
            out.push_back(std::move(game));
        }
    } else {
        GameData game;
        game.name = title->value;
        game.platform = platform;
        game.roms = dedupRoms(roms);
        out.push_back(std::move(game));
    }
}

std::vector<GameData> DATParser::parse(const std::vector<uint8_t>& blob, const ParseContext& ctx) {
    std::vector<GameData> games;
    std::string platform = ctx.platformHint;
    DatTokenizer tok(blob);
    size_t malformed = 0;
    std::string lastError;

    while (true) {
        DatToken t = tok.next();
        if (t.kind == DatTokenKind::End)
            break;

        if (t.kind == DatTokenKind::Close) {
            Logger::debug("DAT: stray ')' at line " + std::to_string(t.line));
            continue;
        }
        if (t.kind != DatTokenKind::Word) {
            continue;
        }
        // top-level "key value" pairs carry nothing we keep
        if (tok.peek().kind != DatTokenKind::Open) {
            continue;
        }
        tok.next();

        DatClause block;
        block.key = t.text;
        block.isList = true;
        block.line = t.line;

        std::string error;
        if (!readList(tok, block, 1, error)) {
            ++malformed;
            lastError = error;
            Logger::warn(ctx.sourceName + ": skipping malformed block: " + error);
            continue;
        }

        if (block.key == "clrmamepro") {
            const DatClause* header = block.find("name");
            if (platform.empty() && header && !header->value.empty()) {
                platform = trim(header->value);
                Logger::debug("DAT: platform from header: " + platform);
            }
        } else if (isBlockKeyword(block.key)) {
            extractGames(block, platform, ctx.profile, games);
        }
    }

    if (games.empty() && malformed > 0) {
        throw ParseError(ctx.sourceName + ": " + lastError);
    }
    if (platform.empty() && !games.empty()) {
        throw ParseError(ctx.sourceName + ": no platform could be derived");
    }
    return games;
}

REGISTER_PARSER(DATParser)
