#pragma once
#include "gamerecord.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

enum class OpenMode {
    Create,     // drop any existing file and create the schema
    ReadWrite,  // existing database
    ReadOnly
};

// SQLite-backed catalog of GameRecords. Only idempotent inserts and point
// lookups; every run rebuilds the file from scratch.
class CatalogStore {
public:
    CatalogStore() = default;
    ~CatalogStore();
    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;
    CatalogStore(CatalogStore&& other) noexcept;
    CatalogStore& operator=(CatalogStore&& other) noexcept;

    // Only Create uses profile; otherwise it is read from the games table.
    void open(const std::string& path, CatalogProfile profile, OpenMode mode);
    void close();
    bool isOpen() const { return db != nullptr; }
    CatalogProfile profile() const { return currentProfile; }

    // One transaction. Key conflicts are skipped; anything else rolls the
    // whole batch back and throws PersistenceError. Returns rows inserted.
    size_t bulkInsert(const std::vector<GameRecord>& records);

    // Case-insensitive exact match, first row in storage order.
    std::optional<GameRecord> lookupByHash(const std::string& hash) const;
    std::optional<GameRecord> lookupByFilename(const std::string& filename) const;

    size_t count() const;

    static const char* schemaFor(CatalogProfile profile);

private:
    void requireOpen() const;
    void exec(const char* sql) const;
    CatalogProfile detectProfile() const;
    std::optional<GameRecord> lookupOne(const std::string& sql, const std::string& key) const;

    sqlite3* db = nullptr;
    CatalogProfile currentProfile = CatalogProfile::Filename;
};
