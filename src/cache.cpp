#include "cache.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "storage/jsonl_codec.hpp"
#include "storage/sqlite_store.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

namespace llmcache {

using json = nlohmann::json;

static EntryMap key_entries(const std::vector<CacheEntry>& entries) {
    EntryMap map;
    map.reserve(entries.size());
    for (const auto& entry : entries) {
        map[entry.key()] = entry;
    }
    return map;
}

// ── Batch ───────────────────────────────────────────────────────

Cache::Batch::Batch(Cache& cache)
    : cache_(&cache), uncaught_at_start_(std::uncaught_exceptions()) {}

Cache::Batch::Batch(Batch&& other) noexcept
    : cache_(other.cache_), uncaught_at_start_(other.uncaught_at_start_) {
    other.cache_ = nullptr;
}

Cache::Batch::~Batch() {
    if (!cache_) return;
    if (std::uncaught_exceptions() > uncaught_at_start_) {
        rollback();
        return;
    }
    try {
        commit();
    } catch (const std::exception& e) {
        std::cerr << "[cache] Error: batch commit failed: " << e.what() << "\n";
    }
}

void Cache::Batch::commit() {
    if (!cache_) return;
    Cache* cache = cache_;
    cache_ = nullptr;
    cache->end_batch(true);
}

void Cache::Batch::rollback() {
    if (!cache_) return;
    Cache* cache = cache_;
    cache_ = nullptr;
    cache->end_batch(false);
}

// ── Construction ────────────────────────────────────────────────

Cache::Cache(bool immediate_write) : immediate_write_(immediate_write) {}

Cache::Cache(EntryMap data, bool immediate_write)
    : data_(std::move(data)), immediate_write_(immediate_write) {}

Cache::~Cache() = default;

Cache::Cache(const Cache& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    data_ = other.data_;
    new_entries_ = other.new_entries_;
    fetched_ = other.fetched_;
    flushed_ = other.flushed_;
    immediate_write_ = other.immediate_write_;
    verbose_ = other.verbose_;
    dropped_writes_ = other.dropped_writes_;
    filename_ = other.filename_;
}

Cache& Cache::operator=(const Cache& other) {
    if (this == &other) return *this;
    std::scoped_lock lock(mutex_, other.mutex_);
    data_ = other.data_;
    new_entries_ = other.new_entries_;
    fetched_ = other.fetched_;
    flushed_ = other.flushed_;
    pending_.clear();
    immediate_write_ = other.immediate_write_;
    verbose_ = other.verbose_;
    dropped_writes_ = other.dropped_writes_;
    filename_ = other.filename_;
    store_.reset();
    return *this;
}

Cache Cache::open(const std::string& filename, bool immediate_write) {
    bool is_jsonl = ends_with(filename, ".jsonl");
    bool is_db = ends_with(filename, ".db");
    if (!is_jsonl && !is_db) {
        throw CacheError("Invalid file extension for " + filename + ". Must be .jsonl or .db");
    }

    Cache cache(immediate_write);
    cache.filename_ = filename;

    std::error_code ec;
    if (!std::filesystem::exists(filename, ec)) {
        std::cerr << "[cache] File " << filename
                  << " not found, but will write to this location.\n";
        return cache;
    }

    if (is_jsonl) {
        cache.data_ = key_entries(read_jsonl(filename));
    } else {
        cache.store_ = std::make_unique<SqliteStore>(filename);
        cache.data_ = key_entries(cache.store_->load_all());
    }
    return cache;
}

Cache Cache::from_jsonl(const std::string& path) {
    return Cache(key_entries(read_jsonl(path)));
}

Cache Cache::from_sqlite_db(const std::string& path) {
    SqliteStore store(path);
    return Cache(key_entries(store.load_all()));
}

Cache Cache::from_json(const json& j) {
    if (!j.is_object()) {
        throw DeserializationError("Cache: expected a JSON object of entries");
    }
    EntryMap map;
    for (const auto& [key, value] : j.items()) {
        try {
            CacheEntry entry = CacheEntry::from_json(value);
            map[entry.key()] = std::move(entry);
        } catch (const DeserializationError& e) {
            throw DeserializationError("Cache [" + key + "]: " + e.what());
        }
    }
    return Cache(std::move(map));
}

// ── Lookup ──────────────────────────────────────────────────────

FetchResult Cache::fetch(const std::string& model,
                         const json& parameters,
                         const std::string& system_prompt,
                         const std::string& user_prompt,
                         int64_t iteration) {
    FetchResult result;
    result.key = CacheEntry::gen_key(model, parameters, system_prompt, user_prompt, iteration);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(result.key);
    if (it == data_.end()) {
        if (verbose_) std::cerr << "[cache] Cache miss for key: " << result.key << "\n";
        return result;
    }

    if (verbose_) std::cerr << "[cache] Cache hit for key: " << result.key << "\n";
    result.output = it->second.parsed_output();
    result.entry = it->second;
    fetched_[result.key] = it->second;
    return result;
}

FetchResult Cache::fetch(const FetchInput& input) {
    return fetch(input.model, input.parameters, input.system_prompt,
                 input.user_prompt, input.iteration);
}

std::optional<CacheEntry> Cache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

bool Cache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.count(key) > 0;
}

size_t Cache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

std::vector<std::string> Cache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& [key, entry] : data_) {
        result.push_back(key);
    }
    return result;
}

EntryMap Cache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void Cache::for_each(const std::function<void(const std::string&, const CacheEntry&)>& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, entry] : data_) {
        fn(key, entry);
    }
}

// ── Writes ──────────────────────────────────────────────────────

bool Cache::stage(const std::string& key, const CacheEntry& entry, bool write_now) {
    // Must be called with mutex_ already held.
    if (write_now) {
        data_[key] = entry;
        new_entries_[key] = entry;
        flushed_.erase(key);
        return true;
    }
    if (batch_open_) {
        pending_[key] = entry;
    } else {
        dropped_writes_++;
        std::cerr << "[cache] Warning: delayed write outside a batch discarded (key "
                  << key << "). Use begin_batch() to commit delayed writes.\n";
    }
    return false;
}

void Cache::persist_locked(const std::vector<std::pair<std::string, CacheEntry>>& committed) {
    // Must be called with mutex_ already held.
    if (filename_.empty() || committed.empty()) return;

    std::vector<CacheEntry> entries;
    entries.reserve(committed.size());
    for (const auto& [key, entry] : committed) {
        entries.push_back(entry);
    }

    if (ends_with(filename_, ".jsonl")) {
        append_jsonl_file(filename_, entries);
    } else {
        if (!store_) store_ = std::make_unique<SqliteStore>(filename_);
        store_->upsert(entries);
    }
    for (const auto& [key, entry] : committed) {
        flushed_.insert(key);
    }
}

std::string Cache::store(const std::string& model,
                         const json& parameters,
                         const std::string& system_prompt,
                         const std::string& user_prompt,
                         int64_t iteration,
                         const json& response,
                         const std::optional<std::string>& service,
                         bool validated) {
    StoreInput input;
    input.model = model;
    input.parameters = parameters;
    input.system_prompt = system_prompt;
    input.user_prompt = user_prompt;
    input.iteration = iteration;
    input.response = response;
    input.service = service;
    input.validated = validated;
    return store(input);
}

std::string Cache::store(const StoreInput& input) {
    CacheEntry entry = CacheEntry::from_store_input(input);
    std::string key = entry.key();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stage(key, entry, immediate_write_)) {
        persist_locked({{key, entry}});
    }
    return key;
}

void Cache::add_from_dict(const EntryMap& new_data, bool write_now) {
    std::vector<std::pair<std::string, CacheEntry>> committed;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [given_key, entry] : new_data) {
        std::string key = entry.key();
        if (key != given_key && verbose_) {
            std::cerr << "[cache] Re-keyed entry " << given_key << " as " << key << "\n";
        }
        if (stage(key, entry, write_now)) committed.emplace_back(key, entry);
    }
    persist_locked(committed);
}

void Cache::add_from_dict(const json& new_data, bool write_now) {
    add_from_dict(from_json(new_data).snapshot(), write_now);
}

void Cache::insert(const CacheEntry& entry, bool write_now) {
    std::string key = entry.key();
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage(key, entry, write_now)) {
        persist_locked({{key, entry}});
    }
}

void Cache::add_from_jsonl(const std::string& path, bool write_now) {
    add_from_dict(key_entries(read_jsonl(path)), write_now);
}

void Cache::add_from_sqlite(const std::string& path, bool write_now) {
    SqliteStore store(path);
    add_from_dict(key_entries(store.load_all()), write_now);
}

Cache::Batch Cache::begin_batch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (batch_open_) {
        throw CacheError("Cache: a batch is already open");
    }
    batch_open_ = true;
    return Batch(*this);
}

void Cache::end_batch(bool commit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, CacheEntry>> committed;
    if (commit) {
        for (auto& [key, entry] : pending_) {
            data_[key] = entry;
            new_entries_[key] = entry;
            flushed_.erase(key);
            committed.emplace_back(key, std::move(entry));
        }
    } else if (!pending_.empty()) {
        std::cerr << "[cache] Batch rolled back, discarded " << pending_.size()
                  << " pending entries\n";
    }
    pending_.clear();
    batch_open_ = false;
    persist_locked(committed);
}

bool Cache::batch_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_open_;
}

size_t Cache::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

uint64_t Cache::dropped_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_writes_;
}

// ── Derived caches ──────────────────────────────────────────────

Cache Cache::subset(const std::unordered_set<std::string>& keys) const {
    EntryMap result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : keys) {
        auto it = data_.find(key);
        if (it != data_.end()) result.emplace(key, it->second);
    }
    return Cache(std::move(result));
}

Cache Cache::subset(const std::vector<std::string>& keys) const {
    return subset(std::unordered_set<std::string>(keys.begin(), keys.end()));
}

Cache Cache::new_entries_cache() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Cache(new_entries_);
}

Cache Cache::session_cache() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EntryMap result = new_entries_;
    for (const auto& [key, entry] : fetched_) {
        result.emplace(key, entry);
    }
    return Cache(std::move(result));
}

Cache Cache::difference(const Cache& other) const {
    EntryMap theirs = other.snapshot();
    EntryMap result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, entry] : data_) {
        if (theirs.count(key) == 0) result.emplace(key, entry);
    }
    return Cache(std::move(result), immediate_write_);
}

Cache Cache::operator+(const Cache& other) const {
    Cache result(snapshot(), immediate_write_);
    result += other;
    return result;
}

Cache& Cache::operator+=(const Cache& other) {
    EntryMap theirs = other.snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, entry] : theirs) {
        data_.emplace(key, std::move(entry));
    }
    return *this;
}

bool Cache::operator==(const Cache& other) const {
    if (this == &other) return true;
    return snapshot() == other.snapshot();
}

// ── Persistence ─────────────────────────────────────────────────

std::vector<CacheEntry> Cache::sorted_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, CacheEntry>> items(data_.begin(), data_.end());
    std::sort(items.begin(), items.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<CacheEntry> entries;
    entries.reserve(items.size());
    for (auto& item : items) {
        entries.push_back(std::move(item.second));
    }
    return entries;
}

void Cache::write(const std::string& filename) const {
    if (ends_with(filename, ".jsonl")) {
        write_jsonl(filename);
    } else if (ends_with(filename, ".db")) {
        write_sqlite_db(filename);
    } else {
        throw CacheError("Invalid file extension for " + filename + ". Must be .jsonl or .db");
    }
}

void Cache::write() const {
    if (filename_.empty()) {
        throw CacheError("Cache: no file bound; pass a filename to write()");
    }
    write(filename_);
}

void Cache::write_jsonl(const std::string& path) const {
    write_jsonl_file(path, sorted_entries());
}

void Cache::write_sqlite_db(const std::string& path) const {
    SqliteStore store(path);
    store.upsert(sorted_entries());
}

size_t Cache::flush() {
    if (filename_.empty()) {
        throw CacheError("Cache: no file bound; nothing to flush to");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, CacheEntry>> unflushed;
    for (const auto& [key, entry] : new_entries_) {
        if (flushed_.count(key) == 0) unflushed.emplace_back(key, entry);
    }
    persist_locked(unflushed);
    return unflushed.size();
}

json Cache::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json j = json::object();
    for (const auto& [key, entry] : data_) {
        j[key] = entry.to_json();
    }
    return j;
}

} // namespace llmcache
