#include <catch2/catch_test_macros.hpp>
#include "cache.hpp"
#include "errors.hpp"
#include "storage/jsonl_codec.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace llmcache;
using json = nlohmann::json;

static std::string cache_test_path(const std::string& ext) {
    return "/tmp/llmcache_test_cache_" + std::to_string(getpid()) + ext;
}

struct FileFixture {
    std::string path;

    explicit FileFixture(const std::string& ext) : path(cache_test_path(ext)) {
        cleanup();
    }
    ~FileFixture() { cleanup(); }

    void cleanup() const {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

static const char* kSystem = "The quick brown fox jumps over the lazy dog.";
static const char* kUser = "What does the fox say?";

static Cache cache_with(std::initializer_list<CacheEntry> entries) {
    EntryMap map;
    for (const auto& e : entries) map[e.key()] = e;
    return Cache(map);
}

// ── Fetch ────────────────────────────────────────────────────────

TEST_CASE("Cache: fetch on empty cache misses", "[cache]") {
    Cache cache;
    auto result = cache.fetch("gpt-3.5-turbo", json("{'temperature': 0.5}"), kSystem, kUser, 1);
    REQUIRE_FALSE(result.hit());
    REQUIRE_FALSE(result.output.has_value());
    REQUIRE_FALSE(result.entry.has_value());
    REQUIRE(result.key == "5ee60636048b05b4f7b6995a0cf9b78e");
}

TEST_CASE("Cache: store then fetch returns the response", "[cache]") {
    Cache cache;
    json params = {{"temperature", 0.5}};
    json response = {{"choices", {{{"text", "hello"}}}}};

    auto key = cache.store("gpt-4", params, "sys", "user", 0, response, std::string("openai"));
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.contains(key));

    auto result = cache.fetch("gpt-4", params, "sys", "user", 0);
    REQUIRE(result.hit());
    REQUIRE(result.key == key);
    REQUIRE(result.output.value_or(json()) == response);
    REQUIRE(result.entry->service == std::optional<std::string>("openai"));
}

TEST_CASE("Cache: different iteration misses", "[cache]") {
    Cache cache;
    cache.store("m", json::object(), "s", "u", 0, "a");
    REQUIRE(cache.fetch("m", json::object(), "s", "u", 0).hit());
    REQUIRE_FALSE(cache.fetch("m", json::object(), "s", "u", 1).hit());
}

TEST_CASE("Cache: storing the same identity overwrites", "[cache]") {
    Cache cache;
    cache.store("m", json::object(), "s", "u", 0, "first");
    cache.store("m", json::object(), "s", "u", 0, "second");
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.fetch("m", json::object(), "s", "u", 0).output.value_or(json()) == "second");
}

TEST_CASE("Cache: store and fetch via input structs", "[cache]") {
    Cache cache;
    auto entry = CacheEntry::example();
    auto key = cache.store(entry.store_input());
    REQUIRE(key == entry.key());

    auto result = cache.fetch(entry.fetch_input());
    REQUIRE(result.hit());
    REQUIRE(*result.entry == entry);
}

TEST_CASE("Cache: invalid UTF-8 identity raises CacheError", "[cache]") {
    Cache cache;
    REQUIRE_THROWS_AS(cache.fetch("gpt-4", json::object(), "\xff\xfe", kUser, 0), CacheError);
    REQUIRE_THROWS_AS(cache.store("gpt-4", json::object(), "\xff\xfe", kUser, 0, json("ok")),
                      CacheError);
    REQUIRE_THROWS_AS(cache.store("gpt-4", json{{"stop", "\xff"}}, kSystem, kUser, 0, json("ok")),
                      CacheError);
    REQUIRE(cache.empty());
}

// ── Delayed writes ───────────────────────────────────────────────

TEST_CASE("Cache: delayed store outside a batch is dropped", "[cache][batch]") {
    Cache cache(false);
    cache.store("m", json::object(), "s", "u", 0, "x");
    REQUIRE(cache.empty());
    REQUIRE(cache.dropped_writes() == 1);
    REQUIRE_FALSE(cache.fetch("m", json::object(), "s", "u", 0).hit());
}

TEST_CASE("Cache: batch commits on scope exit", "[cache][batch]") {
    Cache cache(false);
    {
        auto batch = cache.begin_batch();
        REQUIRE(cache.batch_open());
        cache.store("m", json::object(), "s", "u", 0, "x");
        cache.store("m", json::object(), "s", "u", 1, "y");
        REQUIRE(cache.pending_count() == 2);
        REQUIRE(cache.empty());
    }
    REQUIRE_FALSE(cache.batch_open());
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.pending_count() == 0);
    REQUIRE(cache.dropped_writes() == 0);
    REQUIRE(cache.new_entries_cache().size() == 2);
}

TEST_CASE("Cache: explicit rollback discards pending writes", "[cache][batch]") {
    Cache cache(false);
    auto batch = cache.begin_batch();
    cache.store("m", json::object(), "s", "u", 0, "x");
    batch.rollback();
    REQUIRE_FALSE(batch.active());
    REQUIRE(cache.empty());
    REQUIRE_FALSE(cache.batch_open());
}

TEST_CASE("Cache: batch rolls back when an exception unwinds", "[cache][batch]") {
    Cache cache(false);
    try {
        auto batch = cache.begin_batch();
        cache.store("m", json::object(), "s", "u", 0, "x");
        throw std::runtime_error("model call failed");
    } catch (const std::runtime_error&) {
    }
    REQUIRE(cache.empty());
    REQUIRE_FALSE(cache.batch_open());
}

TEST_CASE("Cache: a second open batch is rejected", "[cache][batch]") {
    Cache cache(false);
    auto batch = cache.begin_batch();
    REQUIRE_THROWS_AS(cache.begin_batch(), CacheError);
    batch.commit();
    REQUIRE_NOTHROW(cache.begin_batch().commit());
}

TEST_CASE("Cache: write_now bypasses the delayed-write buffer", "[cache][batch]") {
    Cache cache(false);
    cache.insert(CacheEntry::example(), true);
    REQUIRE(cache.size() == 1);

    cache.insert(CacheEntry::example("b"), false);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.dropped_writes() == 1);
}

TEST_CASE("Cache: committing a batch writes the bound file", "[cache][batch]") {
    FileFixture f(".jsonl");
    auto cache = Cache::open(f.path, false);
    {
        auto batch = cache.begin_batch();
        cache.insert(CacheEntry::example(), false);
    }
    REQUIRE(std::filesystem::exists(f.path));
    REQUIRE(Cache::from_jsonl(f.path) == cache);
}

// ── add_from_dict ────────────────────────────────────────────────

TEST_CASE("Cache::add_from_dict: entries are re-keyed", "[cache]") {
    Cache cache;
    auto entry = CacheEntry::example();
    cache.add_from_dict(EntryMap{{"stale-key", entry}});
    REQUIRE_FALSE(cache.contains("stale-key"));
    REQUIRE(cache.contains(entry.key()));
}

TEST_CASE("Cache::add_from_dict: accepts a JSON mapping", "[cache]") {
    Cache cache;
    auto a = CacheEntry::example("a");
    auto b = CacheEntry::example("b");
    json payload = {{a.key(), a.to_json()}, {"whatever", b.to_json()}};
    cache.add_from_dict(payload);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.get(b.key()).has_value());
}

TEST_CASE("Cache::add_from_dict: malformed JSON entry throws", "[cache]") {
    Cache cache;
    json payload = {{"k", {{"model", "m"}}}};
    REQUIRE_THROWS_AS(cache.add_from_dict(payload), DeserializationError);
    REQUIRE(cache.empty());
}

TEST_CASE("Cache::add_from_dict: delayed import waits for the batch", "[cache]") {
    Cache cache;
    auto batch = cache.begin_batch();
    cache.add_from_dict(EntryMap{{"k", CacheEntry::example()}}, false);
    REQUIRE(cache.empty());
    batch.commit();
    REQUIRE(cache.size() == 1);
}

// ── Derived caches ───────────────────────────────────────────────

TEST_CASE("Cache::subset: only requested keys that exist", "[cache]") {
    auto a = CacheEntry::example("a");
    auto b = CacheEntry::example("b");
    auto cache = cache_with({a, b});

    auto sub = cache.subset(std::vector<std::string>{a.key(), "missing"});
    REQUIRE(sub.size() == 1);
    REQUIRE(sub.contains(a.key()));
    REQUIRE(cache.size() == 2);
}

TEST_CASE("Cache: merging with an empty cache is identity", "[cache]") {
    auto cache = cache_with({CacheEntry::example("a"), CacheEntry::example("b")});
    REQUIRE(cache + Cache() == cache);
    REQUIRE(Cache() + cache == cache);
}

TEST_CASE("Cache: merge keeps the receiver's entry on collision", "[cache]") {
    auto mine = CacheEntry::example();
    auto theirs = mine;
    theirs.output = "\"other\"";

    auto left = cache_with({mine});
    auto right = cache_with({theirs, CacheEntry::example("b")});

    auto merged = left + right;
    REQUIRE(merged.size() == 2);
    REQUIRE(merged.get(mine.key())->output == mine.output);

    left += right;
    REQUIRE(left == merged);
}

TEST_CASE("Cache: equality compares entries, not timestamps", "[cache]") {
    auto a = CacheEntry::example();
    auto b = a;
    b.timestamp = 1;
    REQUIRE(cache_with({a}) == cache_with({b}));
    REQUIRE(cache_with({a}) != cache_with({CacheEntry::example("x")}));
    REQUIRE(cache_with({a}) != Cache());
}

TEST_CASE("Cache::new_entries_cache: only entries added this session", "[cache]") {
    auto loaded = CacheEntry::example("loaded");
    auto cache = cache_with({loaded});
    cache.insert(CacheEntry::example("fresh"));

    auto fresh = cache.new_entries_cache();
    REQUIRE(fresh.size() == 1);
    REQUIRE(fresh.contains(CacheEntry::example("fresh").key()));
}

TEST_CASE("Cache::session_cache: new entries plus fetch hits", "[cache]") {
    auto hit = CacheEntry::example("hit");
    auto unused = CacheEntry::example("unused");
    auto cache = cache_with({hit, unused});
    cache.insert(CacheEntry::example("fresh"));
    REQUIRE(cache.fetch(hit.fetch_input()).hit());

    auto session = cache.session_cache();
    REQUIRE(session.size() == 2);
    REQUIRE(session.contains(hit.key()));
    REQUIRE_FALSE(session.contains(unused.key()));
}

TEST_CASE("Cache::difference: entries missing from the other cache", "[cache]") {
    auto a = CacheEntry::example("a");
    auto b = CacheEntry::example("b");
    auto diff = cache_with({a, b}).difference(cache_with({b}));
    REQUIRE(diff.size() == 1);
    REQUIRE(diff.contains(a.key()));
}

TEST_CASE("Cache: copies are independent", "[cache]") {
    Cache original = cache_with({CacheEntry::example()});
    Cache copy = original;
    copy.insert(CacheEntry::example("b"));
    REQUIRE(original.size() == 1);
    REQUIRE(copy.size() == 2);
}

// ── JSON ─────────────────────────────────────────────────────────

TEST_CASE("Cache: to_json and from_json round trip", "[cache]") {
    auto cache = cache_with({CacheEntry::example("a"), CacheEntry::example("b")});
    auto j = cache.to_json();
    REQUIRE(j.size() == 2);
    REQUIRE(Cache::from_json(j) == cache);
}

TEST_CASE("Cache::from_json: non-object throws", "[cache]") {
    REQUIRE_THROWS_AS(Cache::from_json(json::array()), DeserializationError);
}

// ── Persistence ──────────────────────────────────────────────────

TEST_CASE("Cache::open: rejects unknown extensions", "[cache][persistence]") {
    REQUIRE_THROWS_AS(Cache::open("/tmp/cache.txt"), CacheError);
    REQUIRE_THROWS_AS(Cache().write("/tmp/cache.txt"), CacheError);
}

TEST_CASE("Cache::open: missing file gives an empty bound cache", "[cache][persistence]") {
    FileFixture f(".jsonl");
    auto cache = Cache::open(f.path);
    REQUIRE(cache.empty());
    REQUIRE(cache.filename() == f.path);

    cache.insert(CacheEntry::example());
    cache.write();
    REQUIRE(Cache::open(f.path).size() == 1);
}

TEST_CASE("Cache::write: unbound cache has nowhere to write", "[cache][persistence]") {
    Cache cache;
    REQUIRE_THROWS_AS(cache.write(), CacheError);
    REQUIRE_THROWS_AS(cache.flush(), CacheError);
}

TEST_CASE("Cache: jsonl round trip", "[cache][persistence]") {
    FileFixture f(".jsonl");
    auto cache = cache_with({CacheEntry::example("a"), CacheEntry::example("b")});
    cache.write_jsonl(f.path);
    REQUIRE(Cache::from_jsonl(f.path) == cache);
}

TEST_CASE("Cache: sqlite round trip", "[cache][persistence]") {
    FileFixture f(".db");
    auto cache = cache_with({CacheEntry::example("a"), CacheEntry::example("b")});
    cache.write_sqlite_db(f.path);
    REQUIRE(Cache::from_sqlite_db(f.path) == cache);
}

TEST_CASE("Cache::from_jsonl: missing file throws", "[cache][persistence]") {
    REQUIRE_THROWS_AS(Cache::from_jsonl("/tmp/llmcache_definitely_missing.jsonl"),
                      CacheFileNotFoundError);
}

TEST_CASE("Cache: loaded entries are not new entries", "[cache][persistence]") {
    FileFixture f(".db");
    cache_with({CacheEntry::example()}).write(f.path);

    auto cache = Cache::open(f.path);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.new_entries_cache().empty());
}

TEST_CASE("Cache: immediate writes append to a bound log", "[cache][persistence]") {
    FileFixture f(".jsonl");
    auto cache = Cache::open(f.path);

    cache.insert(CacheEntry::example("a"));
    REQUIRE(read_jsonl(f.path).size() == 1);

    cache.store(CacheEntry::example("b").store_input());
    REQUIRE(read_jsonl(f.path).size() == 2);
    REQUIRE(cache.flush() == 0);
    REQUIRE(Cache::from_jsonl(f.path) == cache);
}

TEST_CASE("Cache: immediate writes upsert into a bound database", "[cache][persistence]") {
    FileFixture f(".db");
    cache_with({CacheEntry::example("old")}).write(f.path);

    auto cache = Cache::open(f.path);
    cache.insert(CacheEntry::example("new"));
    REQUIRE(Cache::from_sqlite_db(f.path).size() == 2);
    REQUIRE(cache.flush() == 0);
}

TEST_CASE("Cache: add_from_dict writes through only when immediate", "[cache][persistence]") {
    FileFixture f(".db");
    auto cache = Cache::open(f.path);

    EntryMap incoming{{"ignored", CacheEntry::example("dict")}};
    cache.add_from_dict(incoming, true);
    REQUIRE(Cache::from_sqlite_db(f.path).size() == 1);

    {
        auto batch = cache.begin_batch();
        cache.add_from_dict(EntryMap{{"x", CacheEntry::example("delayed")}}, false);
        REQUIRE(Cache::from_sqlite_db(f.path).size() == 1);
    }
    REQUIRE(Cache::from_sqlite_db(f.path).size() == 2);
}

TEST_CASE("Cache::flush: retries a failed write-through", "[cache][persistence]") {
    std::string blocker = cache_test_path(".dir");
    std::filesystem::remove_all(blocker);
    { std::ofstream(blocker) << "not a directory"; }
    std::string path = blocker + "/cache.jsonl";

    auto cache = Cache::open(path);
    auto entry = CacheEntry::example();
    REQUIRE_THROWS_AS(cache.insert(entry), CacheError);
    REQUIRE(cache.contains(entry.key()));

    std::filesystem::remove(blocker);
    REQUIRE(cache.flush() == 1);
    REQUIRE(cache.flush() == 0);
    REQUIRE(read_jsonl(path).size() == 1);
    std::filesystem::remove_all(blocker);
}

TEST_CASE("Cache::add_from_jsonl: merges a file into the cache", "[cache][persistence]") {
    FileFixture f(".jsonl");
    cache_with({CacheEntry::example("a")}).write(f.path);

    Cache cache = cache_with({CacheEntry::example("b")});
    cache.add_from_jsonl(f.path);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.new_entries_cache().size() == 1);
}

TEST_CASE("Cache::add_from_sqlite: merges a database into the cache", "[cache][persistence]") {
    FileFixture f(".db");
    cache_with({CacheEntry::example("a")}).write(f.path);

    Cache cache;
    cache.add_from_sqlite(f.path);
    REQUIRE(cache.size() == 1);
}

// ── Concurrency ──────────────────────────────────────────────────

TEST_CASE("Cache: concurrent stores and fetches", "[cache][threads]") {
    Cache cache;
    constexpr size_t kThreads = 8;
    constexpr size_t kPerThread = 50;

    std::vector<std::thread> workers;
    for (size_t t = 0; t < kThreads; t++) {
        workers.emplace_back([&cache, t] {
            for (size_t i = 0; i < kPerThread; i++) {
                std::string user = "thread " + std::to_string(t) + " call " + std::to_string(i);
                cache.store("gpt-4", json::object(), "sys", user, 0, json{{"n", i}});
                cache.fetch("gpt-4", json::object(), "sys", user, 0);
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(cache.size() == kThreads * kPerThread);
    REQUIRE(cache.new_entries_cache().size() == kThreads * kPerThread);
    for (size_t t = 0; t < kThreads; t++) {
        for (size_t i = 0; i < kPerThread; i++) {
            std::string user = "thread " + std::to_string(t) + " call " + std::to_string(i);
            auto result = cache.fetch("gpt-4", json::object(), "sys", user, 0);
            REQUIRE(result.hit());
            REQUIRE((*result.output)["n"] == i);
        }
    }
}

TEST_CASE("Cache: concurrent writes to a bound database all land", "[cache][threads][persistence]") {
    FileFixture f(".db");
    auto cache = Cache::open(f.path);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; t++) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 10; i++) {
                cache.insert(CacheEntry::example(std::to_string(t) + "/" + std::to_string(i)));
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(Cache::from_sqlite_db(f.path).size() == 40);
}
