#include "cache_handler.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "storage/jsonl_codec.hpp"
#include "storage/sqlite_store.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace llmcache {

CacheHandler::CacheHandler(CacheConfig config) : config_(std::move(config)) {}

static void ensure_writable(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw CacheError("cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::string writable_target = fs::exists(path, ec) ? path
                                 : (parent.empty() ? std::string(".") : parent.string());
    if (::access(writable_target.c_str(), W_OK) != 0) {
        throw CacheError(writable_target + " is not writable");
    }
}

static std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheError("cannot read " + path);
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return buf.str();
}

uint32_t CacheHandler::migrate(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return 0;

    if (ends_with(path, ".db")) {
        SqliteStore store(path);
        return store.migrated_rows();
    }

    if (ends_with(path, ".jsonl")) {
        std::string text = read_file(path);
        if (!is_dict_export(text)) return 0;

        std::vector<CacheEntry> entries;
        try {
            entries = parse_dict_export(text, path);
        } catch (const DeserializationError& e) {
            throw MigrationError(std::string("cannot migrate JSON export: ") + e.what());
        }
        if (!atomic_write_file(path, format_jsonl(entries))) {
            throw MigrationError("cannot rewrite " + path + " as an append-log");
        }
        std::cerr << "[cache_handler] Migrated " << entries.size()
                  << " entries from JSON export to append-log: " << path << "\n";
        return static_cast<uint32_t>(entries.size());
    }

    throw MigrationError("unknown cache format for " + path + " (expected .db or .jsonl)");
}

void CacheHandler::import_legacy(const std::string& path) {
    std::string legacy = normalize_cache_path(config_.legacy_database_path);
    if (legacy.empty() || legacy == path) return;

    std::error_code ec;
    if (std::filesystem::exists(path, ec) || !std::filesystem::exists(legacy, ec)) return;

    migrate(legacy);
    Cache old = Cache::open(legacy);
    old.write(path);
    std::cerr << "[cache_handler] Imported " << old.size()
              << " entries from legacy location " << legacy << " into " << path << "\n";
}

std::shared_ptr<Cache> CacheHandler::open_store(const std::string& path) {
    if (!ends_with(path, ".db") && !ends_with(path, ".jsonl")) {
        throw CacheError("unsupported cache file extension for " + path +
                         " (expected .db or .jsonl)");
    }
    ensure_writable(path);
    import_legacy(path);
    if (ends_with(path, ".db")) {
        // Creates the database if needed and upgrades legacy layouts.
        SqliteStore store(path);
    } else {
        migrate(path);
    }

    auto cache = std::make_shared<Cache>(Cache::open(path, config_.immediate_write));
    cache->set_verbose(config_.verbose);
    return cache;
}

std::shared_ptr<Cache> CacheHandler::get_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cache_) return cache_;

    std::string primary = resolve_database_path(config_);
    try {
        cache_ = open_store(primary);
        active_path_ = primary;
        return cache_;
    } catch (const MigrationError&) {
        throw;
    } catch (const DeserializationError&) {
        throw;
    } catch (const CacheError& e) {
        std::string fallback = normalize_cache_path(config_.fallback_path);
        if (fallback.empty()) {
            throw CacheInitializationError("cannot open default cache at " + primary +
                                           ": " + e.what());
        }

        std::cerr << "[cache_handler] Warning: default cache location " << primary
                  << " is unusable (" << e.what() << "); using fallback " << fallback << "\n";
        try {
            cache_ = open_store(fallback);
        } catch (const MigrationError&) {
            throw;
        } catch (const DeserializationError&) {
            throw;
        } catch (const CacheError& fe) {
            throw CacheInitializationError("cannot open default cache at " + primary + " (" +
                                           e.what() + ") or fallback " + fallback + " (" +
                                           fe.what() + ")");
        }
        active_path_ = fallback;
        used_fallback_ = true;
        return cache_;
    }
}

std::string CacheHandler::active_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_path_;
}

bool CacheHandler::used_fallback() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_fallback_;
}

} // namespace llmcache
