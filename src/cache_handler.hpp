#pragma once
#include "cache.hpp"
#include "config.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace llmcache {

// Locates (or creates) the default persistent cache described by a
// CacheConfig and upgrades legacy on-disk layouts on the way.
//
// The handler is an ordinary object: construct one per process (or per test
// with a temporary location) and share it.
class CacheHandler {
public:
    explicit CacheHandler(CacheConfig config);

    const CacheConfig& config() const { return config_; }

    // Open the default cache, creating and migrating its store as needed.
    // Repeated calls return the same instance.
    //
    // Throws CacheInitializationError if neither the configured location nor
    // the fallback can be used, MigrationError / DeserializationError if the
    // store exists but cannot be read.
    std::shared_ptr<Cache> get_cache();

    // Path of the store get_cache() opened, empty before the first call.
    std::string active_path() const;

    // True if get_cache() had to use fallback_path.
    bool used_fallback() const;

    // Bring the store at `path` to the current layout. Returns the number of
    // entries moved; 0 when already current.
    static uint32_t migrate(const std::string& path);

private:
    std::shared_ptr<Cache> open_store(const std::string& path);
    void import_legacy(const std::string& path);

    CacheConfig config_;
    std::shared_ptr<Cache> cache_;
    std::string active_path_;
    bool used_fallback_ = false;
    mutable std::mutex mutex_;
};

} // namespace llmcache
