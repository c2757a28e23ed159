#include "sqlite_store.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace llmcache {

using json = nlohmann::json;

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw CacheError("SqliteStore: failed to begin transaction: " + msg);
        }
    }

    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw CacheError("SqliteStore: failed to commit: " + msg);
        }
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

static const char* kSelectColumns =
    "SELECT key, model, parameters, system_prompt, user_prompt, iteration,"
    " output, timestamp, service, validated FROM cache_entries";

static const char* kUpsertSql =
    "INSERT OR REPLACE INTO cache_entries (key, model, parameters, system_prompt,"
    " user_prompt, iteration, output, timestamp, service, validated)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

// Binds with explicit length so prompts may contain NUL bytes.
static void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
    sqlite3_bind_text(stmt, col, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// Build an entry from a row selected with kSelectColumns.
static CacheEntry entry_from_stmt(sqlite3_stmt* stmt, const std::string& path) {
    std::string key = column_string(stmt, 0);
    std::string where = path + " [" + key + "]";

    CacheEntry entry;
    entry.model = column_string(stmt, 1);

    std::string params = column_string(stmt, 2);
    entry.parameters = json::parse(params, nullptr, false);
    if (entry.parameters.is_discarded()) {
        throw DeserializationError(where + ": parameters is not valid JSON");
    }

    entry.system_prompt = column_string(stmt, 3);
    entry.user_prompt   = column_string(stmt, 4);
    entry.iteration     = sqlite3_column_int64(stmt, 5);
    entry.output        = column_string(stmt, 6);
    if (!json::accept(entry.output)) {
        throw DeserializationError(where + ": output is not valid JSON");
    }
    entry.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
        entry.service = column_string(stmt, 8);
    }
    entry.validated = sqlite3_column_int(stmt, 9) != 0;
    return entry;
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw CacheError("SqliteStore: cannot create directory " + parent.string() +
                             ": " + ec.message());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw CacheError("SqliteStore: failed to open database " + path_ + ": " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        migrate();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) const {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw CacheError("SqliteStore: " + path_ + ": " + msg);
    }
}

int SqliteStore::schema_version() const {
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw CacheError("SqliteStore: " + path_ + ": cannot read user_version");
    }
    return sqlite3_column_int(g.stmt, 0);
}

bool SqliteStore::table_exists(const char* name) const {
    StmtGuard g;
    const char* sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, name, -1, SQLITE_STATIC);
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

void SqliteStore::migrate() {
    int version = schema_version();
    if (version > kSchemaVersion) {
        throw MigrationError("SqliteStore: " + path_ + " has schema version " +
                             std::to_string(version) + ", newest supported is " +
                             std::to_string(kSchemaVersion));
    }
    if (version == kSchemaVersion) return;
    if (version != 0) {
        throw MigrationError("SqliteStore: " + path_ + " has unknown schema version " +
                             std::to_string(version));
    }
    // Version 0 is a fresh file or the legacy layout. Any cache_entries table
    // here was not written by this store, which stamps the version with it.
    if (table_exists("cache_entries")) {
        throw MigrationError("SqliteStore: " + path_ +
                             " has an unversioned cache_entries table");
    }

    Transaction tx(db_);
    exec("CREATE TABLE cache_entries ("
         "  key           TEXT PRIMARY KEY,"
         "  model         TEXT NOT NULL,"
         "  parameters    TEXT NOT NULL,"
         "  system_prompt TEXT NOT NULL,"
         "  user_prompt   TEXT NOT NULL,"
         "  iteration     INTEGER NOT NULL,"
         "  output        TEXT NOT NULL,"
         "  timestamp     INTEGER NOT NULL,"
         "  service       TEXT,"
         "  validated     INTEGER NOT NULL DEFAULT 0"
         ");");

    if (table_exists("data")) {
        migrate_legacy_rows();
        exec("DROP TABLE data;");
    }

    exec(("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";").c_str());
    tx.commit();

    if (migrated_rows_ > 0) {
        std::cerr << "[sqlite_store] Migrated " << migrated_rows_
                  << " entries from legacy layout: " << path_ << "\n";
    }
}

void SqliteStore::migrate_legacy_rows() {
    // Must be called inside migrate()'s transaction.
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT key, value FROM data;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw MigrationError("SqliteStore: " + path_ + ": unreadable legacy table: " +
                             sqlite3_errmsg(db_));
    }

    std::vector<CacheEntry> entries;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        std::string key = column_string(g.stmt, 0);
        std::string value = column_string(g.stmt, 1);
        try {
            entries.push_back(CacheEntry::from_json(json::parse(value)));
        } catch (const json::parse_error& e) {
            throw MigrationError("SqliteStore: " + path_ + " legacy row '" + key +
                                 "': " + e.what());
        } catch (const DeserializationError& e) {
            throw MigrationError("SqliteStore: " + path_ + " legacy row '" + key +
                                 "': " + e.what());
        }
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw MigrationError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }

    try {
        write_rows(entries);
    } catch (const CacheError& e) {
        throw MigrationError(std::string("SqliteStore: legacy migration failed: ") + e.what());
    }
    migrated_rows_ = static_cast<uint32_t>(entries.size());
}

std::vector<CacheEntry> SqliteStore::load_all() const {
    StmtGuard g;
    std::string sql = std::string(kSelectColumns) + ";";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }

    std::vector<CacheEntry> entries;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        entries.push_back(entry_from_stmt(g.stmt, path_));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    return entries;
}

std::optional<CacheEntry> SqliteStore::get(const std::string& key) const {
    StmtGuard g;
    std::string sql = std::string(kSelectColumns) + " WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return entry_from_stmt(g.stmt, path_);
    if (rc != SQLITE_DONE) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    return std::nullopt;
}

uint32_t SqliteStore::count() const {
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cache_entries;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

void SqliteStore::write_rows(const std::vector<CacheEntry>& entries) {
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, kUpsertSql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CacheError("SqliteStore: " + path_ + ": " + sqlite3_errmsg(db_));
    }

    for (const auto& entry : entries) {
        std::string key = entry.key();
        std::string params = canonical_json(entry.parameters);

        sqlite3_reset(g.stmt);
        sqlite3_clear_bindings(g.stmt);
        bind_text(g.stmt, 1, key);
        bind_text(g.stmt, 2, entry.model);
        bind_text(g.stmt, 3, params);
        bind_text(g.stmt, 4, entry.system_prompt);
        bind_text(g.stmt, 5, entry.user_prompt);
        sqlite3_bind_int64(g.stmt, 6, entry.iteration);
        bind_text(g.stmt, 7, entry.output);
        sqlite3_bind_int64(g.stmt, 8, static_cast<int64_t>(entry.timestamp));
        if (entry.service) {
            bind_text(g.stmt, 9, *entry.service);
        } else {
            sqlite3_bind_null(g.stmt, 9);
        }
        sqlite3_bind_int(g.stmt, 10, entry.validated ? 1 : 0);

        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw CacheError("SqliteStore: " + path_ + ": failed to write entry " + key +
                             ": " + sqlite3_errmsg(db_));
        }
    }
}

void SqliteStore::upsert(const std::vector<CacheEntry>& entries) {
    if (entries.empty()) return;

    Transaction tx(db_);
    write_rows(entries);
    tx.commit();
}

} // namespace llmcache
