#pragma once
#include <string>
#include <cstdint>

namespace llmcache {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// True if `s` ends with `suffix`
bool ends_with(const std::string& s, const std::string& suffix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Per-user cache directory ($XDG_CACHE_HOME/llmcache or ~/.cache/llmcache)
std::string user_cache_dir();

// Lowercase hex MD5 digest of `data`
std::string md5_hex(const std::string& data);

// Write `content` to a sibling temp file and rename it over `path`.
// Creates missing parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Interpret "1", "true", "yes", "on" (any case) as true
bool parse_bool(const std::string& s);

} // namespace llmcache
