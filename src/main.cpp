#include "cache.hpp"
#include "cache_entry.hpp"
#include "cache_handler.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: llmcache [--config PATH] COMMAND [args]\n"
              << "\n"
              << "Commands:\n"
              << "  stats [FILE]              Entry count per model and service\n"
              << "  key IDENTITY              Print the cache key for an identity\n"
              << "  fetch [FILE] IDENTITY     Print the cached output, exit 1 on miss\n"
              << "  convert IN OUT            Re-encode a cache (.jsonl <-> .db)\n"
              << "  merge OUT IN...           Union of several caches (first wins)\n"
              << "  subset IN OUT KEY...      Copy only the listed keys\n"
              << "  migrate [FILE]            Upgrade a legacy store in place\n"
              << "\n"
              << "FILE defaults to the configured default cache.\n"
              << "\n"
              << "Identity options:\n"
              << "  --model NAME              Model identifier (required)\n"
              << "  --parameters JSON         Parameter mapping (default: {})\n"
              << "  --system TEXT             System prompt\n"
              << "  --user TEXT               User prompt\n"
              << "  --iteration N             Iteration (default: 0)\n"
              << "\n"
              << "Environment variables:\n"
              << "  LLMCACHE_DATABASE_PATH    Default cache location (.db or .jsonl)\n"
              << "  LLMCACHE_FALLBACK_PATH    Used when the default location is unusable\n"
              << "  LLMCACHE_VERBOSE          Log cache hits and misses\n";
}

// Split command arguments into positionals and an identity.
static bool parse_identity(const std::vector<std::string>& args,
                           std::vector<std::string>& positional,
                           llmcache::FetchInput& identity) {
    bool have_model = false;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--model" && has_value) {
            identity.model = args[++i];
            have_model = true;
        } else if (a == "--parameters" && has_value) {
            identity.parameters = nlohmann::json::parse(args[++i]);
        } else if (a == "--system" && has_value) {
            identity.system_prompt = args[++i];
        } else if (a == "--user" && has_value) {
            identity.user_prompt = args[++i];
        } else if (a == "--iteration" && has_value) {
            identity.iteration = std::stoll(args[++i]);
        } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            std::cerr << "Unknown option: " << a << "\n";
            return false;
        } else {
            positional.push_back(a);
        }
    }
    if (!have_model) {
        std::cerr << "Error: --model is required\n";
        return false;
    }
    return true;
}

static llmcache::Cache open_cache(const std::vector<std::string>& positional,
                                  const llmcache::Config& config) {
    if (!positional.empty()) {
        return llmcache::Cache::open(positional[0]);
    }
    llmcache::CacheHandler handler(config.cache);
    return *handler.get_cache();
}

static int cmd_stats(const std::vector<std::string>& args, const llmcache::Config& config) {
    llmcache::Cache cache = open_cache(args, config);

    std::map<std::string, size_t> per_model;
    std::map<std::string, size_t> per_service;
    cache.for_each([&](const std::string& /*key*/, const llmcache::CacheEntry& entry) {
        per_model[entry.model]++;
        per_service[entry.service.value_or("(none)")]++;
    });

    std::cout << "Entries: " << cache.size() << "\n";
    std::cout << "Models:\n";
    for (const auto& [model, n] : per_model) {
        std::cout << "  " << model << ": " << n << "\n";
    }
    std::cout << "Services:\n";
    for (const auto& [service, n] : per_service) {
        std::cout << "  " << service << ": " << n << "\n";
    }
    return 0;
}

static int cmd_key(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    llmcache::FetchInput identity;
    if (!parse_identity(args, positional, identity)) return 1;
    std::cout << llmcache::CacheEntry::gen_key(identity) << "\n";
    return 0;
}

static int cmd_fetch(const std::vector<std::string>& args, const llmcache::Config& config) {
    std::vector<std::string> positional;
    llmcache::FetchInput identity;
    if (!parse_identity(args, positional, identity)) return 1;

    llmcache::Cache cache = open_cache(positional, config);
    auto result = cache.fetch(identity);
    if (!result.hit()) {
        std::cerr << "miss: " << result.key << "\n";
        return 1;
    }
    std::cout << result.output->dump(2) << "\n";
    return 0;
}

static int cmd_convert(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Error: convert takes IN and OUT\n";
        return 1;
    }
    llmcache::Cache cache = llmcache::Cache::open(args[0]);
    cache.write(args[1]);
    std::cout << "Wrote " << cache.size() << " entries to " << args[1] << "\n";
    return 0;
}

static int cmd_merge(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Error: merge takes OUT and at least one IN\n";
        return 1;
    }
    llmcache::Cache merged;
    for (size_t i = 1; i < args.size(); i++) {
        merged += llmcache::Cache::open(args[i]);
    }
    merged.write(args[0]);
    std::cout << "Wrote " << merged.size() << " entries to " << args[0] << "\n";
    return 0;
}

static int cmd_subset(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "Error: subset takes IN, OUT and at least one KEY\n";
        return 1;
    }
    llmcache::Cache cache = llmcache::Cache::open(args[0]);
    std::vector<std::string> keys(args.begin() + 2, args.end());
    llmcache::Cache relevant = cache.subset(keys);
    relevant.write(args[1]);
    std::cout << "Wrote " << relevant.size() << " of " << keys.size()
              << " requested entries to " << args[1] << "\n";
    return 0;
}

static int cmd_migrate(const std::vector<std::string>& args, const llmcache::Config& config) {
    std::string path = args.empty() ? config.resolved_database_path() : args[0];
    uint32_t moved = llmcache::CacheHandler::migrate(path);
    if (moved == 0) {
        std::cout << path << " is already current\n";
    } else {
        std::cout << "Migrated " << moved << " entries in " << path << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        if (command.empty() && (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0)) {
            print_usage();
            return 0;
        } else if (command.empty() && std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (command.empty()) {
            command = argv[i];
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    auto config = config_path.empty() ? llmcache::Config::load()
                                      : llmcache::Config::load_from(config_path);

    if (command == "stats")   return cmd_stats(args, config);
    if (command == "key")     return cmd_key(args);
    if (command == "fetch")   return cmd_fetch(args, config);
    if (command == "convert") return cmd_convert(args);
    if (command == "merge")   return cmd_merge(args);
    if (command == "subset")  return cmd_subset(args);
    if (command == "migrate") return cmd_migrate(args, config);

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
} catch (const llmcache::CacheError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
}
