#include "jsonl_codec.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace llmcache {

using json = nlohmann::json;

// Unwrap the legacy {"<key>": {...}} line form.
static const json& unwrap_line(const json& j) {
    if (j.is_object() && j.size() == 1 && !j.contains("model") &&
        j.begin().value().is_object()) {
        return j.begin().value();
    }
    return j;
}

std::vector<CacheEntry> parse_jsonl(const std::string& text, const std::string& source) {
    std::vector<CacheEntry> entries;
    std::istringstream stream(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        std::string where = source + ":" + std::to_string(line_no);
        json j;
        try {
            j = json::parse(line);
        } catch (const json::parse_error& e) {
            throw DeserializationError(where + ": malformed JSON: " + e.what());
        }

        try {
            entries.push_back(CacheEntry::from_json(unwrap_line(j)));
        } catch (const DeserializationError& e) {
            throw DeserializationError(where + ": " + e.what());
        }
    }
    return entries;
}

std::vector<CacheEntry> read_jsonl(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheFileNotFoundError("File " + path + " not found");
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return parse_jsonl(buf.str(), path);
}

std::string format_jsonl(const std::vector<CacheEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        try {
            out += entry.to_json().dump();
        } catch (const json::type_error& e) {
            throw CacheError("format_jsonl: entry for model '" + entry.model +
                             "' cannot be encoded: " + e.what());
        }
        out += '\n';
    }
    return out;
}

void write_jsonl_file(const std::string& path, const std::vector<CacheEntry>& entries) {
    if (!atomic_write_file(path, format_jsonl(entries))) {
        throw CacheError("write_jsonl: failed to write " + path);
    }
}

void append_jsonl_file(const std::string& path, const std::vector<CacheEntry>& entries) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw CacheError("append_jsonl: cannot create " + parent.string() + ": " +
                             ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw CacheError("append_jsonl: failed to open " + path);
    }
    out << format_jsonl(entries);
    out.flush();
    if (!out.good()) {
        throw CacheError("append_jsonl: failed to write " + path);
    }
}

bool is_dict_export(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || j.contains("model")) return false;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_object()) return false;
    }
    return true;
}

std::vector<CacheEntry> parse_dict_export(const std::string& text, const std::string& source) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DeserializationError(source + ": malformed JSON: " + e.what());
    }
    if (!j.is_object()) {
        throw DeserializationError(source + ": expected a JSON object of entries");
    }

    std::vector<CacheEntry> entries;
    entries.reserve(j.size());
    for (const auto& [key, value] : j.items()) {
        try {
            entries.push_back(CacheEntry::from_json(value));
        } catch (const DeserializationError& e) {
            throw DeserializationError(source + " [" + key + "]: " + e.what());
        }
    }
    return entries;
}

} // namespace llmcache
