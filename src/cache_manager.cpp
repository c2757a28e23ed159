#include "cache_manager.hpp"
#include "errors.hpp"
#include <iostream>
#include <vector>

namespace llmcache {

CacheManager::CacheManager(CacheHandler& handler, RemoteCache* remote)
    : handler_(handler), remote_(remote) {}

std::shared_ptr<Cache> CacheManager::resolve(const CacheOptions& options) {
    switch (options.mode) {
        case CacheOptions::Mode::Provided:
            if (!options.provided) {
                throw CacheError("CacheManager: provided cache mode without a cache");
            }
            return options.provided;
        case CacheOptions::Mode::Disabled:
            return std::make_shared<Cache>(false);
        case CacheOptions::Mode::Default:
            break;
    }
    return handler_.get_cache();
}

bool CacheManager::use_remote_cache(const CacheOptions& options) const {
    bool wanted = options.remote_cache.value_or(handler_.config().remote_cache);
    if (!wanted || !remote_) return false;

    try {
        return remote_->remote_caching_enabled();
    } catch (const RemoteCacheError& e) {
        std::cerr << "[remote_cache] " << remote_->service_name()
                  << " unreachable, remote caching off: " << e.what() << "\n";
        return false;
    }
}

size_t CacheManager::pull_remote(Cache& cache) {
    if (!remote_) return 0;

    std::vector<CacheEntry> entries = remote_->fetch_entries(cache.keys());
    EntryMap incoming;
    for (auto& entry : entries) {
        std::string key = entry.key();
        incoming[key] = std::move(entry);
    }
    cache.add_from_dict(incoming, true);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, entry] : incoming) {
        pulled_keys_.insert(key);
    }
    std::cerr << "[remote_cache] Pulled " << incoming.size() << " entries from "
              << remote_->service_name() << "\n";
    return incoming.size();
}

size_t CacheManager::push_new_entries(const Cache& cache) {
    if (!remote_) return 0;

    std::vector<CacheEntry> outgoing;
    {
        EntryMap fresh = cache.new_entries_cache().snapshot();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, entry] : fresh) {
            if (pulled_keys_.count(key) == 0) outgoing.push_back(std::move(entry));
        }
    }
    if (outgoing.empty()) return 0;

    size_t accepted = remote_->store_entries(outgoing);
    std::cerr << "[remote_cache] Pushed " << accepted << " of " << outgoing.size()
              << " new entries to " << remote_->service_name() << "\n";
    return accepted;
}

} // namespace llmcache
