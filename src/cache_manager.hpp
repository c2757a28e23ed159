#pragma once
#include "cache.hpp"
#include "cache_handler.hpp"
#include "remote_cache.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace llmcache {

// How a run wants its cache chosen.
struct CacheOptions {
    enum class Mode {
        Default,   // the handler's persistent default cache
        Disabled,  // a fresh non-persistent cache with delayed writes
        Provided   // the cache in `provided`
    };

    Mode mode = Mode::Default;
    std::shared_ptr<Cache> provided;

    // nullopt follows CacheConfig::remote_cache.
    std::optional<bool> remote_cache;

    static CacheOptions use(std::shared_ptr<Cache> cache) {
        CacheOptions opts;
        opts.mode = Mode::Provided;
        opts.provided = std::move(cache);
        return opts;
    }

    static CacheOptions disabled() {
        CacheOptions opts;
        opts.mode = Mode::Disabled;
        return opts;
    }
};

// Caller-side glue that picks the cache for a run and keeps it in step with
// an optional remote cache service.
class CacheManager {
public:
    // `remote` may be null; it must outlive this manager.
    explicit CacheManager(CacheHandler& handler, RemoteCache* remote = nullptr);

    // Throws CacheError if Mode::Provided is requested without a cache, and
    // whatever CacheHandler::get_cache() throws for Mode::Default.
    std::shared_ptr<Cache> resolve(const CacheOptions& options);

    // True if a remote service is attached, the options (or config) ask for
    // it, and the service reports remote caching as enabled. A service that
    // cannot be reached counts as disabled.
    bool use_remote_cache(const CacheOptions& options) const;

    // Import remote entries the local cache lacks. Returns the count imported.
    size_t pull_remote(Cache& cache);

    // Upload entries this session added, except those pulled from the remote.
    size_t push_new_entries(const Cache& cache);

private:
    CacheHandler& handler_;
    RemoteCache* remote_;
    std::unordered_set<std::string> pulled_keys_;
    mutable std::mutex mutex_;
};

} // namespace llmcache
