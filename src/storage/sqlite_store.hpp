#pragma once
#include "../cache_entry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sqlite3; // forward declare

namespace llmcache {

// Relational encoding of a cache: one row per entry in `cache_entries`,
// primary key = entry key.
//
// Opening a database brings it to the current schema, stored in
// PRAGMA user_version. Version 0 is either a fresh file or the older
// `data(key, value)` layout, which never set a version; the latter is migrated
// in one transaction. Any other version, or a version 0 file that already has
// a cache_entries table, raises MigrationError.
class SqliteStore {
public:
    static constexpr int kSchemaVersion = 2;

    explicit SqliteStore(const std::string& path);
    ~SqliteStore();

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    const std::string& path() const { return path_; }

    int schema_version() const;

    // Rows moved out of a legacy table while opening (0 if none).
    uint32_t migrated_rows() const { return migrated_rows_; }

    // Every row as an entry. Throws DeserializationError naming the row key.
    std::vector<CacheEntry> load_all() const;

    std::optional<CacheEntry> get(const std::string& key) const;

    uint32_t count() const;

    // Insert or overwrite rows, keyed by CacheEntry::key(), in one transaction.
    void upsert(const std::vector<CacheEntry>& entries);

private:
    void migrate();
    void migrate_legacy_rows();
    void write_rows(const std::vector<CacheEntry>& entries);
    bool table_exists(const char* name) const;
    void exec(const char* sql) const;

    sqlite3* db_ = nullptr;
    std::string path_;
    uint32_t migrated_rows_ = 0;
};

} // namespace llmcache
