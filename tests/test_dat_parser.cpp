#include <catch2/catch.hpp>
#include "parser_registry.hpp"
#include "dat_tokenizer.hpp"
#include "errors.hpp"
#include "test_support.hpp"

namespace {

const std::string kSha1 = "DEADBEEFDEADBEEFDEADBEEFDEADBEEFDEADBEEF";
const std::string kSha1Lower = "deadbeefdeadbeefdeadbeefdeadbeefdeadbeef";

std::vector<GameData> parseDat(const std::string& text,
                               CatalogProfile profile = CatalogProfile::Filename,
                               const std::string& platform = "Nintendo - Game Boy") {
    auto parser = ParserRegistry::instance().create("DAT");
    REQUIRE(parser);
    ParseContext ctx;
    ctx.platformHint = platform;
    ctx.sourceName = "test.dat";
    ctx.profile = profile;
    return parser->parse(bytesOf(text), ctx);
}

}

TEST_CASE("tokenizer splits parentheses, quoted strings and bare words") {
    std::vector<uint8_t> blob = bytesOf("game (\n  name \"Super Game (USA)\"\n  rom ( name a.bin )\n)");
    DatTokenizer tok(blob);

    DatToken t = tok.next();
    REQUIRE(t.kind == DatTokenKind::Word);
    REQUIRE(t.text == "game");
    REQUIRE(tok.next().kind == DatTokenKind::Open);
    REQUIRE(tok.next().text == "name");
    t = tok.next();
    REQUIRE(t.kind == DatTokenKind::Quoted);
    REQUIRE(t.text == "Super Game (USA)");
    REQUIRE(t.line == 2);
    REQUIRE(tok.peek().text == "rom");
    REQUIRE(tok.next().text == "rom");
    REQUIRE(tok.next().kind == DatTokenKind::Open);
    REQUIRE(tok.next().text == "name");
    REQUIRE(tok.next().text == "a.bin");
    REQUIRE(tok.next().kind == DatTokenKind::Close);
    REQUIRE(tok.next().kind == DatTokenKind::Close);
    REQUIRE(tok.next().kind == DatTokenKind::End);
}

TEST_CASE("tokenizer treats an unterminated quote as part of a bare word") {
    std::vector<uint8_t> blob = bytesOf("name \"broken.bin size 4\nsha1 x");
    DatTokenizer tok(blob);
    REQUIRE(tok.next().text == "name");
    DatToken t = tok.next();
    REQUIRE(t.kind == DatTokenKind::Word);
    REQUIRE(t.text == "\"broken.bin");
    REQUIRE(tok.next().text == "size");
}

TEST_CASE("single-line game block yields one lowercased record") {
    auto games = parseDat("game ( name \"Super Game\" rom ( name game.bin sha1 " + kSha1 + " ) )");
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].name == "Super Game");
    REQUIRE(games[0].filename == "game.bin");
    REQUIRE(games[0].platform == "Nintendo - Game Boy");

    auto records = toRecords(games);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].name == "Super Game");
    REQUIRE(records[0].filename == "game.bin");
    REQUIRE(records[0].hash == kSha1Lower);
}

TEST_CASE("multi-line clrmamepro DAT with interleaved clauses") {
    const std::string dat =
        "clrmamepro (\n"
        "\tname \"Nintendo - Game Boy\"\n"
        "\tdescription \"Nintendo - Game Boy\"\n"
        "\tversion 20240101-000000\n"
        ")\n"
        "\n"
        "game (\n"
        "\tname \"Tetris (World) (Rev 1)\"\n"
        "\tdescription \"Tetris (World) (Rev 1)\"\n"
        "\tregion \"World\"\n"
        "\trom ( name \"Tetris (World) (Rev 1).gb\" size 32768 crc 46DF91AD "
        "md5 084F1E457749CDEC86183189BD88CE69 sha1 74591CC9501AF93873F9A5D3EB12DA12C0723BBC flags verified )\n"
        ")\n"
        "\n"
        "game (\n"
        "\trom ( sha1 " + kSha1 + " size 16 name second.gb )\n"
        "\tname \"Second\"\n"
        ")\n";

    auto games = parseDat(dat);
    REQUIRE(games.size() == 2);

    REQUIRE(games[0].name == "Tetris (World) (Rev 1)");
    REQUIRE(games[0].filename == "Tetris (World) (Rev 1).gb");
    REQUIRE(games[0].roms.size() == 1);
    const RomEntry& rom = games[0].roms[0];
    REQUIRE(rom.size == 32768);
    REQUIRE(rom.crc == "46df91ad");
    REQUIRE(rom.md5 == "084f1e457749cdec86183189bd88ce69");
    REQUIRE(rom.sha1 == "74591cc9501af93873f9a5d3eb12da12c0723bbc");

    REQUIRE(games[1].name == "Second");
    REQUIRE(games[1].filename == "second.gb");
    REQUIRE(games[1].roms[0].sha1 == kSha1Lower);
}

TEST_CASE("filename token starting with a quote becomes an empty filename") {
    auto games = parseDat("game ( name \"Bad Quote\" rom ( name \"broken.bin sha1 " + kSha1 + " ) )");
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].name == "Bad Quote");
    REQUIRE(games[0].filename.empty());
    REQUIRE(toRecords(games)[0].hash == kSha1Lower);
}

TEST_CASE("blocks without a valid sha1 or name yield nothing") {
    const std::string dat =
        "game ( name \"No Hash\" rom ( name a.bin crc 12345678 ) )\n"
        "game ( name \"Short Hash\" rom ( name b.bin sha1 DEADBEEF ) )\n"
        "game ( name \"Not Hex\" rom ( name c.bin sha1 ZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZZ ) )\n"
        "game ( description \"No Name\" rom ( name d.bin sha1 " + kSha1 + " ) )\n"
        "game ( name \"No Rom\" )\n"
        "game ( name \"Good\" rom ( name e.bin sha1 " + kSha1 + " ) )\n";

    auto games = parseDat(dat);
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].name == "Good");
}

TEST_CASE("profile decides whether a rom name is required") {
    const std::string dat = "game ( name \"Nameless Rom\" rom ( size 4 sha1 " + kSha1 + " ) )";

    REQUIRE(parseDat(dat, CatalogProfile::Filename).empty());

    auto games = parseDat(dat, CatalogProfile::Name);
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].filename.empty());
    REQUIRE(games[0].roms[0].sha1 == kSha1Lower);
}

TEST_CASE("every rom of a multi-rom game is indexed") {
    const std::string dat =
        "game ( name \"Arcade Set\"\n"
        "  rom ( name prg.bin size 4 sha1 1111111111111111111111111111111111111111 )\n"
        "  rom ( name gfx.bin size 4 sha1 2222222222222222222222222222222222222222 )\n"
        "  rom ( name nodump.bin size 4 flags nodump )\n"
        ")";

    auto byFile = parseDat(dat, CatalogProfile::Filename);
    REQUIRE(byFile.size() == 2);
    REQUIRE(byFile[0].filename == "prg.bin");
    REQUIRE(byFile[1].filename == "gfx.bin");

    auto byName = parseDat(dat, CatalogProfile::Name);
    REQUIRE(byName.size() == 1);
    REQUIRE(byName[0].roms.size() == 2);

    auto records = toRecords(byName);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].hash == "1111111111111111111111111111111111111111");
    REQUIRE(records[1].hash == "2222222222222222222222222222222222222222");
    REQUIRE(records[1].filename.empty());
}

TEST_CASE("an unclosed block is skipped and parsing resumes at the next game") {
    const std::string dat =
        "game ( name \"First\" rom ( name a.bin sha1 " + kSha1 + " ) )\n"
        "game ( name \"Unclosed\" rom ( name b.bin sha1 1111111111111111111111111111111111111111 )\n"
        "game ( name \"Third\" rom ( name c.bin sha1 2222222222222222222222222222222222222222 ) )\n"
        ") )\n";

    auto games = parseDat(dat);
    REQUIRE(games.size() == 2);
    REQUIRE(games[0].name == "First");
    REQUIRE(games[1].name == "Third");
}

TEST_CASE("runaway nesting is rejected and parsing resumes at the next game") {
    const std::string dat =
        "game ( name \"Deep\" rom " + std::string(10000, '(') + std::string(10000, ')') + " )\n"
        "game ( name \"After\" rom ( name after.gb sha1 " + kSha1 + " ) )\n";

    auto games = parseDat(dat);
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].name == "After");
}

TEST_CASE("nesting within the limit is accepted") {
    const std::string dat =
        "game ( name \"Nested\" extra " + std::string(20, '(') + std::string(20, ')') +
        " rom ( name nested.gb sha1 " + kSha1 + " ) )";

    auto games = parseDat(dat);
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].filename == "nested.gb");
}

TEST_CASE("file truncated inside its last block keeps earlier records") {
    const std::string dat =
        "game ( name \"Complete\" rom ( name a.bin sha1 " + kSha1 + " ) )\n"
        "game ( name \"Cut\" rom ( name b.bin sha1 ";

    auto games = parseDat(dat);
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].name == "Complete");
}

TEST_CASE("a file with no readable block raises ParseError") {
    REQUIRE_THROWS_AS(parseDat("game ( name \"Cut\" rom ( name b.bin sha1 "), ParseError);
}

TEST_CASE("a file without games parses to nothing") {
    REQUIRE(parseDat("clrmamepro ( name \"Empty\" )\n").empty());
    REQUIRE(parseDat("").empty());
}

TEST_CASE("header name supplies the platform when no hint is given") {
    const std::string dat =
        "clrmamepro ( name \"Sega - Mega Drive - Genesis\" )\n"
        "game ( name \"Sonic\" rom ( name sonic.md sha1 " + kSha1 + " ) )";

    auto games = parseDat(dat, CatalogProfile::Filename, "");
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].platform == "Sega - Mega Drive - Genesis");

    auto hinted = parseDat(dat, CatalogProfile::Filename, "From Filename");
    REQUIRE(hinted[0].platform == "From Filename");
}

TEST_CASE("games without any platform raise ParseError") {
    REQUIRE_THROWS_AS(
        parseDat("game ( name \"Orphan\" rom ( name o.bin sha1 " + kSha1 + " ) )",
                 CatalogProfile::Filename, ""),
        ParseError);
}

TEST_CASE("stray closing parentheses at top level are ignored") {
    auto games = parseDat(") )\ngame ( name \"Ok\" rom ( name ok.bin sha1 " + kSha1 + " ) )\n)");
    REQUIRE(games.size() == 1);
}

TEST_CASE("machine blocks are read like game blocks") {
    auto games = parseDat("machine ( name \"pacman\" rom ( name pacman.6e sha1 " + kSha1 + " ) )");
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].name == "pacman");
}

TEST_CASE("DAT parser only matches .dat files") {
    auto parser = ParserRegistry::instance().create("DAT");
    REQUIRE(parser->match("Nintendo - Game Boy.dat"));
    REQUIRE(parser->match("UPPER.DAT"));
    REQUIRE_FALSE(parser->match("games.json"));
    REQUIRE_FALSE(parser->match("readme.txt"));
}
