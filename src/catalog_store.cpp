#include "catalog_store.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <memory>
#include <utility>

namespace fs = std::filesystem;

namespace {

const char* kFilenameSchema =
    "CREATE TABLE games ("
    " name TEXT NOT NULL,"
    " filename TEXT NOT NULL,"
    " platform TEXT NOT NULL,"
    " hash TEXT,"
    " UNIQUE(filename, hash));"
    "CREATE INDEX idx_hash ON games (hash);"
    "CREATE INDEX idx_filename ON games (filename);";

const char* kNameSchema =
    "CREATE TABLE games ("
    " name TEXT NOT NULL,"
    " platform TEXT NOT NULL,"
    " hash TEXT,"
    " UNIQUE(name, platform, hash));"
    "CREATE INDEX idx_hash ON games (hash);";

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("SQL error preparing statement: ") + sqlite3_errmsg(db));
    }
    return Statement(stmt, &sqlite3_finalize);
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}

CatalogStore::~CatalogStore() {
    close();
}

CatalogStore::CatalogStore(CatalogStore&& other) noexcept
    : db(std::exchange(other.db, nullptr)), currentProfile(other.currentProfile) {}

CatalogStore& CatalogStore::operator=(CatalogStore&& other) noexcept {
    if (this != &other) {
        close();
        db = std::exchange(other.db, nullptr);
        currentProfile = other.currentProfile;
    }
    return *this;
}

const char* CatalogStore::schemaFor(CatalogProfile profile) {
    return profile == CatalogProfile::Filename ? kFilenameSchema : kNameSchema;
}

void CatalogStore::open(const std::string& path, CatalogProfile profile, OpenMode mode) {
    close();

    int flags = SQLITE_OPEN_READONLY;
    if (mode == OpenMode::Create) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            throw StoreError("Cannot remove existing database " + path + ": " + ec.message());
        }
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    } else if (mode == OpenMode::ReadWrite) {
        flags = SQLITE_OPEN_READWRITE;
    }

    sqlite3* handle = nullptr;
    if (sqlite3_open_v2(path.c_str(), &handle, flags, nullptr) != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        throw StoreError("Cannot open database " + path + ": " + reason);
    }
    db = handle;

    try {
        if (mode == OpenMode::Create) {
            exec(schemaFor(profile));
            currentProfile = profile;
            Logger::info("Database schema initialized (" + profileName(profile) + " profile)");
        } else {
            currentProfile = detectProfile();
            Logger::debug("Opened " + path + " (" + profileName(currentProfile) + " profile)");
        }
    } catch (...) {
        close();
        throw;
    }
}

void CatalogStore::close() {
    if (db) {
        if (sqlite3_close(db) != SQLITE_OK) {
            Logger::error(std::string("sqlite3_close: ") + sqlite3_errmsg(db));
        }
        db = nullptr;
    }
}

void CatalogStore::requireOpen() const {
    if (!db) {
        throw StoreUninitializedError();
    }
}

void CatalogStore::exec(const char* sql) const {
    char* error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "(null)";
        sqlite3_free(error);
        throw StoreError("SQL error: " + message);
    }
}

CatalogProfile CatalogStore::detectProfile() const {
    Statement stmt = prepare(db, "SELECT name FROM pragma_table_info('games')");
    bool hasTable = false;
    bool hasFilename = false;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        hasTable = true;
        if (columnText(stmt.get(), 0) == "filename")
            hasFilename = true;
    }
    if (!hasTable) {
        throw StoreError("Database has no games table");
    }
    return hasFilename ? CatalogProfile::Filename : CatalogProfile::Name;
}

size_t CatalogStore::bulkInsert(const std::vector<GameRecord>& records) {
    requireOpen();

    char* error = nullptr;
    if (sqlite3_exec(db, "BEGIN IMMEDIATE TRANSACTION;", nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "(null)";
        sqlite3_free(error);
        throw PersistenceError("SQL begin failed: " + message);
    }

    size_t inserted = 0;
    try {
        const char* sql = currentProfile == CatalogProfile::Filename
            ? "INSERT OR IGNORE INTO games (name, filename, platform, hash) VALUES (?, ?, ?, ?)"
            : "INSERT OR IGNORE INTO games (name, platform, hash) VALUES (?, ?, ?)";
        Statement stmt(nullptr, &sqlite3_finalize);
        try {
            stmt = prepare(db, sql);
        } catch (const StoreError& e) {
            throw PersistenceError(e.what());
        }

        for (const auto& record : records) {
            int column = 1;
            sqlite3_bind_text(stmt.get(), column++, record.name.c_str(), -1, SQLITE_TRANSIENT);
            if (currentProfile == CatalogProfile::Filename)
                sqlite3_bind_text(stmt.get(), column++, record.filename.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), column++, record.platform.c_str(), -1, SQLITE_TRANSIENT);
            std::string hash = to_lower(record.hash);
            sqlite3_bind_text(stmt.get(), column++, hash.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw PersistenceError("Failed to insert game " + record.name + ": " + sqlite3_errmsg(db));
            }
            inserted += static_cast<size_t>(sqlite3_changes(db));
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
        }
    } catch (...) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "(null)";
        sqlite3_free(error);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw PersistenceError("Failed to commit transaction: " + message);
    }
    return inserted;
}

std::optional<GameRecord> CatalogStore::lookupOne(const std::string& sql, const std::string& key) const {
    Statement stmt = prepare(db, sql);
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw StoreError(std::string("Lookup failed: ") + sqlite3_errmsg(db));
    }

    GameRecord record;
    record.name = columnText(stmt.get(), 0);
    record.filename = columnText(stmt.get(), 1);
    record.platform = columnText(stmt.get(), 2);
    record.hash = columnText(stmt.get(), 3);
    return record;
}

std::optional<GameRecord> CatalogStore::lookupByHash(const std::string& hash) const {
    requireOpen();
    std::string key = to_lower(trim(hash));
    if (key.empty())
        return std::nullopt;

    // hashes are stored lowercase, so the index on hash stays usable
    if (currentProfile == CatalogProfile::Filename) {
        return lookupOne("SELECT name, filename, platform, hash FROM games "
                         "WHERE hash = ? ORDER BY rowid LIMIT 1", key);
    }
    return lookupOne("SELECT name, '' AS filename, platform, hash FROM games "
                     "WHERE hash = ? ORDER BY rowid LIMIT 1", key);
}

std::optional<GameRecord> CatalogStore::lookupByFilename(const std::string& filename) const {
    requireOpen();
    if (filename.empty())
        return std::nullopt;
    if (currentProfile == CatalogProfile::Name) {
        Logger::debug("lookupByFilename: name profile has no filename column");
        return std::nullopt;
    }
    return lookupOne("SELECT name, filename, platform, hash FROM games "
                     "WHERE LOWER(filename) = LOWER(?) ORDER BY rowid LIMIT 1", filename);
}

size_t CatalogStore::count() const {
    requireOpen();
    Statement stmt = prepare(db, "SELECT COUNT(*) FROM games");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(std::string("Count failed: ") + sqlite3_errmsg(db));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}
