#include <catch2/catch.hpp>
#include "hash_engine.hpp"
#include "errors.hpp"
#include "test_support.hpp"

TEST_CASE("fingerprint of a plain file is its lowercase sha1") {
    TempDir dir;
    writeFile(dir / "abc.bin", "abc");
    writeFile(dir / "fox.gb", "The quick brown fox jumps over the lazy dog");
    writeFile(dir / "empty.bin", "");

    HashEngine engine;
    REQUIRE(engine.fingerprint(dir / "abc.bin") == kSha1Abc);
    REQUIRE(engine.fingerprint(dir / "fox.gb") == kSha1Fox);
    REQUIRE(engine.fingerprint(dir / "empty.bin") == kSha1Empty);
}

TEST_CASE("plain file and single-entry archives of the same bytes hash identically") {
    TempDir dir;
    std::string payload = pseudoRandomBytes(200000);
    writeFile(dir / "rom.bin", payload);
    writeZip(dir / "rom.zip", {{"rom.bin", payload}});
    writeGzip(dir / "rom.bin.gz", payload);
    writeXz(dir / "rom.bin.xz", payload);

    HashEngine engine;
    std::string plain = engine.fingerprint(dir / "rom.bin");
    REQUIRE(plain.size() == 40);
    REQUIRE(engine.fingerprint(dir / "rom.zip") == plain);
    REQUIRE(engine.fingerprint(dir / "rom.bin.gz") == plain);
    REQUIRE(engine.fingerprint(dir / "rom.bin.xz") == plain);
}

TEST_CASE("zip fingerprint uses the first entry in declared order") {
    TempDir dir;
    writeZip(dir / "set.zip", {{"z-first.bin", "abc"}, {"a-second.bin", "something else"}});

    HashEngine engine;
    REQUIRE(engine.fingerprint(dir / "set.zip") == kSha1Abc);
}

TEST_CASE("archive detection is by extension, case-insensitive") {
    TempDir dir;
    writeZip(dir / "GAME.ZIP", {{"game.gb", "abc"}});

    HashEngine engine;
    REQUIRE(engine.archiveType(dir / "GAME.ZIP") == "ZIP");
    REQUIRE(engine.archiveType("x.gz") == "GZIP");
    REQUIRE(engine.archiveType("x.xz") == "XZ");
    REQUIRE(engine.archiveType("game.gb").empty());
    REQUIRE(engine.fingerprint(dir / "GAME.ZIP") == kSha1Abc);
}

TEST_CASE("empty archives raise EmptyArchiveError") {
    TempDir dir;
    writeEmptyZip(dir / "empty.zip");
    writeFile(dir / "empty.gz", "");
    writeFile(dir / "empty.xz", "");

    HashEngine engine;
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "empty.zip"), EmptyArchiveError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "empty.gz"), EmptyArchiveError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "empty.xz"), EmptyArchiveError);
}

TEST_CASE("gzip member holding zero bytes is a valid entry") {
    TempDir dir;
    writeGzip(dir / "nothing.gz", "");

    HashEngine engine;
    REQUIRE(engine.fingerprint(dir / "nothing.gz") == kSha1Empty);
}

TEST_CASE("files that are not archives raise ArchiveOpenError") {
    TempDir dir;
    writeFile(dir / "fake.zip", "this is not a zip archive at all");
    writeFile(dir / "fake.gz", "plain text");
    writeFile(dir / "fake.xz", "plain text");

    HashEngine engine;
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "fake.zip"), ArchiveOpenError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "fake.gz"), ArchiveOpenError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "fake.xz"), ArchiveOpenError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "missing.zip"), ArchiveOpenError);
}

TEST_CASE("truncated compressed members raise EntryOpenError") {
    TempDir dir;
    std::string payload = pseudoRandomBytes(100000, 99);
    writeGzip(dir / "full.gz", payload);
    writeXz(dir / "full.xz", payload);

    for (const char* name : {"full.gz", "full.xz"}) {
        std::ifstream in(dir / name, std::ios::binary);
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        writeFile(dir / (std::string("cut-") + name), bytes.substr(0, bytes.size() / 2));
    }

    HashEngine engine;
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "cut-full.gz"), EntryOpenError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "cut-full.xz"), EntryOpenError);
}

TEST_CASE("missing plain files raise IOError") {
    TempDir dir;
    HashEngine engine;
    REQUIRE_THROWS_AS(engine.fingerprint(dir / "nope.bin"), IOError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir.path()), IOError);
}

TEST_CASE("paths that cannot be resolved raise IOError") {
    TempDir dir;
    fs::path loop = dir / "loop.bin";
    fs::create_symlink(loop, loop);

    HashEngine engine;
    REQUIRE_THROWS_AS(engine.fingerprint(loop), IOError);
    REQUIRE_THROWS_AS(engine.fingerprint(dir / std::string(5000, 'a')), IOError);
}
