#pragma once
#include <stdexcept>
#include <string>

namespace llmcache {

// Base for every error raised by the cache layer.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

// A persisted entry is missing required fields or carries invalid JSON.
class DeserializationError : public CacheError {
public:
    explicit DeserializationError(const std::string& what) : CacheError(what) {}
};

// The default on-disk cache location cannot be opened or created.
class CacheInitializationError : public CacheError {
public:
    explicit CacheInitializationError(const std::string& what) : CacheError(what) {}
};

// A legacy-format store cannot be upgraded.
class MigrationError : public CacheError {
public:
    explicit MigrationError(const std::string& what) : CacheError(what) {}
};

class CacheFileNotFoundError : public CacheError {
public:
    explicit CacheFileNotFoundError(const std::string& what) : CacheError(what) {}
};

// Raised by RemoteCache implementations on transport or server failures.
class RemoteCacheError : public CacheError {
public:
    explicit RemoteCacheError(const std::string& what) : CacheError(what) {}
};

} // namespace llmcache
