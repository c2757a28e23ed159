#pragma once
#include "../cache_entry.hpp"
#include <string>
#include <vector>

namespace llmcache {

// Append-log encoding: one JSON object per line, each a CacheEntry::to_json().
//
// Readers also accept the older wrapped form {"<key>": {...entry...}}. Stored
// keys are never trusted; callers re-key entries with CacheEntry::key().

// Parse a whole append-log document. `source` names the file in error messages.
// Blank lines are skipped. Throws DeserializationError with "source:line".
std::vector<CacheEntry> parse_jsonl(const std::string& text, const std::string& source);

// Read an append-log file. Throws CacheFileNotFoundError if it does not exist.
std::vector<CacheEntry> read_jsonl(const std::string& path);

// Throws CacheError if an entry holds text that is not valid UTF-8.
std::string format_jsonl(const std::vector<CacheEntry>& entries);

// Replace the file contents atomically. Throws CacheError on I/O failure.
void write_jsonl_file(const std::string& path, const std::vector<CacheEntry>& entries);

// Append entries to the end of the file, creating it if needed.
void append_jsonl_file(const std::string& path, const std::vector<CacheEntry>& entries);

// True if the document is a single JSON object mapping keys to entry objects
// (the plain-dict export layout) rather than an append-log.
bool is_dict_export(const std::string& text);

// Parse a plain-dict export {key: entry, ...}.
std::vector<CacheEntry> parse_dict_export(const std::string& text, const std::string& source);

} // namespace llmcache
