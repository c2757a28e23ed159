#pragma once
#include "cache_entry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace llmcache {

class SqliteStore;

// Result of Cache::fetch. Both members are empty on a miss.
struct FetchResult {
    std::optional<nlohmann::json> output;
    std::optional<CacheEntry> entry;
    std::string key;

    bool hit() const { return entry.has_value(); }
};

using EntryMap = std::unordered_map<std::string, CacheEntry>;

// Keyed collection of CacheEntry values memoizing model responses.
//
// With immediate_write (the default) store() and add_from_dict() update the
// cache at once. Without it, writes are buffered and only committed when an
// open Batch ends normally; writes made while no batch is open are discarded
// with a warning. A cache bound to a file (see open()) writes every committed
// entry through to it: appended for .jsonl, upserted for .db. All public
// methods are thread-safe.
class Cache {
public:
    // Scoped commit handle returned by begin_batch(). Ending the scope
    // normally commits the buffered writes; unwinding through an exception
    // discards them. commit()/rollback() end the batch early.
    class Batch {
    public:
        ~Batch();

        Batch(Batch&& other) noexcept;
        Batch(const Batch&) = delete;
        Batch& operator=(const Batch&) = delete;
        Batch& operator=(Batch&&) = delete;

        // Move buffered entries into the cache and, if the cache is bound to
        // a file, write them through. Throws CacheError if writing fails.
        void commit();
        void rollback();

        bool active() const { return cache_ != nullptr; }

    private:
        friend class Cache;
        explicit Batch(Cache& cache);

        Cache* cache_;
        int uncaught_at_start_;
    };

    explicit Cache(bool immediate_write = true);
    explicit Cache(EntryMap data, bool immediate_write = true);

    // Load from `filename` (.jsonl or .db) and bind the cache to it. A missing
    // file is created by the first write. Throws CacheError on any other
    // extension, DeserializationError on corrupt content.
    static Cache open(const std::string& filename, bool immediate_write = true);

    static Cache from_jsonl(const std::string& path);
    static Cache from_sqlite_db(const std::string& path);
    static Cache from_json(const nlohmann::json& j);

    // Copies share the bound file but not its open connection.
    Cache(const Cache& other);
    Cache& operator=(const Cache& other);
    ~Cache();

    // ── Lookup ──────────────────────────────────────────────────

    FetchResult fetch(const std::string& model,
                      const nlohmann::json& parameters,
                      const std::string& system_prompt,
                      const std::string& user_prompt,
                      int64_t iteration);
    FetchResult fetch(const FetchInput& input);

    std::optional<CacheEntry> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    std::vector<std::string> keys() const;
    EntryMap snapshot() const;

    // Visit every committed entry under the lock. `fn` must not call back
    // into this cache.
    void for_each(const std::function<void(const std::string&, const CacheEntry&)>& fn) const;

    // ── Writes ──────────────────────────────────────────────────

    // Returns the entry key. On a bound cache, throws CacheError if the
    // write-through fails; the entry stays in memory and flush() retries it.
    std::string store(const std::string& model,
                      const nlohmann::json& parameters,
                      const std::string& system_prompt,
                      const std::string& user_prompt,
                      int64_t iteration,
                      const nlohmann::json& response,
                      const std::optional<std::string>& service = std::nullopt,
                      bool validated = false);
    std::string store(const StoreInput& input);

    // Bulk import. Entries are keyed by their recomputed key; last write wins.
    // With write_now false they follow the delayed-write rules of store().
    void add_from_dict(const EntryMap& new_data, bool write_now = true);
    void add_from_dict(const nlohmann::json& new_data, bool write_now = true);
    void insert(const CacheEntry& entry, bool write_now = true);

    void add_from_jsonl(const std::string& path, bool write_now = true);
    void add_from_sqlite(const std::string& path, bool write_now = true);

    // Throws CacheError if a batch is already open.
    Batch begin_batch();
    bool batch_open() const;
    size_t pending_count() const;
    uint64_t dropped_writes() const;

    // ── Derived caches ──────────────────────────────────────────

    // Entries whose key is in `keys`; unknown keys are ignored.
    Cache subset(const std::unordered_set<std::string>& keys) const;
    Cache subset(const std::vector<std::string>& keys) const;

    // Entries committed by this instance since it was constructed or loaded.
    Cache new_entries_cache() const;

    // New entries plus every entry returned by a fetch hit.
    Cache session_cache() const;

    // Entries whose key does not appear in `other`.
    Cache difference(const Cache& other) const;

    // Union; on colliding keys the receiver's entry is kept.
    Cache operator+(const Cache& other) const;
    Cache& operator+=(const Cache& other);

    // Same key set with equal entries (timestamps ignored).
    bool operator==(const Cache& other) const;
    bool operator!=(const Cache& other) const { return !(*this == other); }

    // ── Persistence ─────────────────────────────────────────────

    // Write everything to `filename`, choosing the codec by extension.
    void write(const std::string& filename) const;
    // Write to the bound file. Throws CacheError if none is bound.
    void write() const;
    void write_jsonl(const std::string& path) const;
    void write_sqlite_db(const std::string& path) const;

    // Persist new entries the bound file does not hold yet, such as those
    // whose write-through failed (append for .jsonl, upsert for .db).
    // Returns the number of entries written.
    size_t flush();

    // {key: entry_dict, ...}
    nlohmann::json to_json() const;

    const std::string& filename() const { return filename_; }
    bool immediate_write() const { return immediate_write_; }
    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    // Returns true if the entry was committed to data_ right away.
    bool stage(const std::string& key, const CacheEntry& entry, bool write_now);
    void end_batch(bool commit);
    void persist_locked(const std::vector<std::pair<std::string, CacheEntry>>& committed);
    std::vector<CacheEntry> sorted_entries() const;

    EntryMap data_;
    EntryMap new_entries_;
    EntryMap fetched_;
    EntryMap pending_;
    std::unordered_set<std::string> flushed_;
    bool immediate_write_ = true;
    bool batch_open_ = false;
    bool verbose_ = false;
    uint64_t dropped_writes_ = 0;
    std::string filename_;
    std::unique_ptr<SqliteStore> store_;  // lazily opened for .db write-through
    mutable std::mutex mutex_;
};

} // namespace llmcache
