#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace llmcache {

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"database_path", ""},
            {"legacy_database_path", ""},
            {"fallback_path", ""},
            {"immediate_write", true},
            {"verbose", false},
            {"remote_cache", false}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    return load_from(expand_home("~/.llmcache/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("database_path") && c["database_path"].is_string())
            cfg.cache.database_path = c["database_path"].get<std::string>();
        if (c.contains("legacy_database_path") && c["legacy_database_path"].is_string())
            cfg.cache.legacy_database_path = c["legacy_database_path"].get<std::string>();
        if (c.contains("fallback_path") && c["fallback_path"].is_string())
            cfg.cache.fallback_path = c["fallback_path"].get<std::string>();
        if (c.contains("immediate_write") && c["immediate_write"].is_boolean())
            cfg.cache.immediate_write = c["immediate_write"].get<bool>();
        if (c.contains("verbose") && c["verbose"].is_boolean())
            cfg.cache.verbose = c["verbose"].get<bool>();
        if (c.contains("remote_cache") && c["remote_cache"].is_boolean())
            cfg.cache.remote_cache = c["remote_cache"].get<bool>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("LLMCACHE_DATABASE_PATH"))
        cfg.cache.database_path = v;
    if (const char* v = std::getenv("LLMCACHE_LEGACY_DATABASE_PATH"))
        cfg.cache.legacy_database_path = v;
    if (const char* v = std::getenv("LLMCACHE_FALLBACK_PATH"))
        cfg.cache.fallback_path = v;
    if (const char* v = std::getenv("LLMCACHE_VERBOSE"))
        cfg.cache.verbose = parse_bool(v);
    if (const char* v = std::getenv("LLMCACHE_REMOTE_CACHE"))
        cfg.cache.remote_cache = parse_bool(v);

    return cfg;
}

std::string normalize_cache_path(const std::string& path) {
    static const std::string prefix = "sqlite:///";
    std::string p = trim(path);
    if (p.compare(0, prefix.size(), prefix) == 0) {
        p = p.substr(prefix.size());
    }
    return expand_home(p);
}

std::string resolve_database_path(const CacheConfig& cache) {
    if (trim(cache.database_path).empty()) {
        return user_cache_dir() + "/lm_model_calls.db";
    }
    return normalize_cache_path(cache.database_path);
}

std::string Config::resolved_database_path() const {
    return resolve_database_path(cache);
}

} // namespace llmcache
