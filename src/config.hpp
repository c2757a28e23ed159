#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace llmcache {

struct CacheConfig {
    std::string database_path;         // empty = default under user_cache_dir()
    std::string legacy_database_path;  // older location imported into a fresh store
    std::string fallback_path;         // used (with a warning) if database_path is unusable
    bool immediate_write = true;
    bool verbose = false;
    bool remote_cache = false;
};

struct Config {
    CacheConfig cache;

    // Load from ~/.llmcache/config.json + env vars
    static Config load();

    // Load from an explicit config file + env vars. A missing file is created
    // with defaults; a malformed one falls back to defaults.
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved path of the default cache store ("sqlite:///" prefix stripped,
    // ~ expanded, default applied when empty).
    std::string resolved_database_path() const;
};

// Strip a "sqlite:///" URI prefix and expand ~.
std::string normalize_cache_path(const std::string& path);

// database_path normalized, or the default store under user_cache_dir().
std::string resolve_database_path(const CacheConfig& cache);

} // namespace llmcache
