#pragma once
#include "cache_entry.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace llmcache {

// A remote cache service holding entries keyed exactly like the local cache.
// Implementations report transport or server failures as RemoteCacheError.
class RemoteCache {
public:
    virtual ~RemoteCache() = default;

    virtual std::string service_name() const = 0;

    // Whether remote caching is turned on for this account.
    virtual bool remote_caching_enabled() = 0;

    // Entries held remotely whose keys are not in `exclude_keys`.
    virtual std::vector<CacheEntry> fetch_entries(const std::vector<std::string>& exclude_keys) = 0;

    // Upload entries. Returns the number the service accepted.
    virtual size_t store_entries(const std::vector<CacheEntry>& entries) = 0;
};

} // namespace llmcache
