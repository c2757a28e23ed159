#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace llmcache {

// Identity of one model invocation: the five fields that determine a cache key.
struct FetchInput {
    std::string model;
    nlohmann::json parameters = nlohmann::json::object();
    std::string system_prompt;
    std::string user_prompt;
    int64_t iteration = 0;
};

// Identity plus the raw response to memoize.
struct StoreInput {
    std::string model;
    nlohmann::json parameters = nlohmann::json::object();
    std::string system_prompt;
    std::string user_prompt;
    int64_t iteration = 0;
    nlohmann::json response;
    std::optional<std::string> service;
    bool validated = false;
};

// One memoized model invocation.
//
// `parameters` holds a JSON value (usually an object such as
// {"temperature": 0.5}); `output` holds the JSON-encoded response text.
// Equality ignores `timestamp`.
struct CacheEntry {
    std::string model;
    nlohmann::json parameters = nlohmann::json::object();
    std::string system_prompt;
    std::string user_prompt;
    int64_t iteration = 0;
    std::string output;
    uint64_t timestamp = 0;
    std::optional<std::string> service;
    bool validated = false;

    // Hex MD5 over model, canonical parameters, both prompts and iteration.
    // Throws CacheError if a text field or parameter string is not valid UTF-8.
    static std::string gen_key(const std::string& model,
                               const nlohmann::json& parameters,
                               const std::string& system_prompt,
                               const std::string& user_prompt,
                               int64_t iteration);

    static std::string gen_key(const FetchInput& input);

    std::string key() const;

    // Build an entry from a store request, serializing `response` into `output`
    // and stamping the current time.
    static CacheEntry from_store_input(const StoreInput& input);

    // All nine fields.
    nlohmann::json to_json() const;

    // Throws DeserializationError when an identity field or `output` is
    // missing or mistyped. Unknown members are ignored.
    static CacheEntry from_json(const nlohmann::json& j);

    FetchInput fetch_input() const;
    StoreInput store_input() const;

    // Parsed `output`. Throws DeserializationError if it is not valid JSON.
    nlohmann::json parsed_output() const;

    bool operator==(const CacheEntry& other) const;
    bool operator!=(const CacheEntry& other) const { return !(*this == other); }

    // Sample entry used by tests and the CLI.
    static CacheEntry example(const std::string& system_prompt_suffix = "");
};

// Stable serialization used for key derivation: sorted keys, ", " and ": "
// separators, non-ASCII escaped as \uXXXX, floats in shortest round-trip
// form (1000000000000000.0, 1e+16, 1e-05). Throws CacheError on strings that
// are not valid UTF-8.
std::string canonical_json(const nlohmann::json& value);

} // namespace llmcache
