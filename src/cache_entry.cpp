#include "cache_entry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace llmcache {

using json = nlohmann::json;

// Shortest round-trip digits, positional for decimal exponents -4..15
// (always with a fractional part), otherwise d.ddde+XX. Keys in existing
// stores were hashed over this form.
static std::string format_float(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Infinity" : "-Infinity";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    std::string out;
    if (sci[0] == '-') {
        out += '-';
        sci.erase(0, 1);
    }
    auto epos = sci.find('e');
    std::string digits = sci.substr(0, epos);
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    int exp = std::stoi(sci.substr(epos + 1));
    int decpt = exp + 1;
    int n = static_cast<int>(digits.size());

    if (decpt > -4 && decpt <= 16) {
        if (decpt <= 0) {
            out += "0." + std::string(static_cast<size_t>(-decpt), '0') + digits;
        } else if (decpt >= n) {
            out += digits + std::string(static_cast<size_t>(decpt - n), '0') + ".0";
        } else {
            out += digits.substr(0, decpt) + "." + digits.substr(decpt);
        }
    } else {
        out += digits.substr(0, 1);
        if (n > 1) out += "." + digits.substr(1);
        out += exp < 0 ? "e-" : "e+";
        std::string mag = std::to_string(exp < 0 ? -exp : exp);
        if (mag.size() < 2) out += '0';
        out += mag;
    }
    return out;
}

static void write_canonical(const json& value, std::string& out) {
    switch (value.type()) {
        case json::value_t::object: {
            // nlohmann::json objects are std::map backed, so iteration is key-sorted.
            out += '{';
            bool first = true;
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (!first) out += ", ";
                first = false;
                out += json(it.key()).dump(-1, ' ', true);
                out += ": ";
                write_canonical(it.value(), out);
            }
            out += '}';
            break;
        }
        case json::value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& item : value) {
                if (!first) out += ", ";
                first = false;
                write_canonical(item, out);
            }
            out += ']';
            break;
        }
        case json::value_t::number_float:
            out += format_float(value.get<double>());
            break;
        default:
            out += value.dump(-1, ' ', true);
            break;
    }
}

std::string canonical_json(const json& value) {
    std::string out;
    try {
        write_canonical(value, out);
    } catch (const json::exception& e) {
        throw CacheError(std::string("canonical_json: ") + e.what());
    }
    return out;
}

// Identity text must be valid UTF-8 so the entry can be persisted.
static void check_utf8(const char* field, const std::string& value) {
    try {
        (void)json(value).dump(-1, ' ', true);
    } catch (const json::type_error& e) {
        throw CacheError(std::string("CacheEntry: field '") + field +
                         "' is not valid UTF-8: " + e.what());
    }
}

static std::string canonical_field(const char* field, const json& value) {
    try {
        return canonical_json(value);
    } catch (const CacheError& e) {
        throw CacheError(std::string("CacheEntry: field '") + field + "': " + e.what());
    }
}

std::string CacheEntry::gen_key(const std::string& model,
                                const json& parameters,
                                const std::string& system_prompt,
                                const std::string& user_prompt,
                                int64_t iteration) {
    check_utf8("model", model);
    check_utf8("system_prompt", system_prompt);
    check_utf8("user_prompt", user_prompt);

    std::string long_key;
    long_key.reserve(model.size() + system_prompt.size() + user_prompt.size() + 64);
    long_key += model;
    long_key += canonical_field("parameters", parameters);
    long_key += system_prompt;
    long_key += user_prompt;
    long_key += std::to_string(iteration);
    return md5_hex(long_key);
}

std::string CacheEntry::gen_key(const FetchInput& input) {
    return gen_key(input.model, input.parameters, input.system_prompt,
                   input.user_prompt, input.iteration);
}

std::string CacheEntry::key() const {
    return gen_key(model, parameters, system_prompt, user_prompt, iteration);
}

CacheEntry CacheEntry::from_store_input(const StoreInput& input) {
    CacheEntry entry;
    entry.model = input.model;
    entry.parameters = input.parameters;
    entry.system_prompt = input.system_prompt;
    entry.user_prompt = input.user_prompt;
    entry.iteration = input.iteration;
    entry.output = canonical_field("response", input.response);
    entry.timestamp = epoch_seconds();
    if (input.service) check_utf8("service", *input.service);
    entry.service = input.service;
    entry.validated = input.validated;
    return entry;
}

json CacheEntry::to_json() const {
    json j = {
        {"model", model},
        {"parameters", parameters},
        {"system_prompt", system_prompt},
        {"user_prompt", user_prompt},
        {"iteration", iteration},
        {"output", output},
        {"timestamp", timestamp},
        {"validated", validated}
    };
    j["service"] = service ? json(*service) : json(nullptr);
    return j;
}

static const json& require_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) {
        throw DeserializationError(std::string("CacheEntry: missing field '") + name + "'");
    }
    return *it;
}

static std::string require_string(const json& j, const char* name) {
    const json& v = require_field(j, name);
    if (!v.is_string()) {
        throw DeserializationError(std::string("CacheEntry: field '") + name +
                                   "' must be a string");
    }
    return v.get<std::string>();
}

CacheEntry CacheEntry::from_json(const json& j) {
    if (!j.is_object()) {
        throw DeserializationError("CacheEntry: expected a JSON object, got " +
                                   std::string(j.type_name()));
    }

    CacheEntry entry;
    entry.model = require_string(j, "model");
    entry.parameters = require_field(j, "parameters");
    entry.system_prompt = require_string(j, "system_prompt");
    entry.user_prompt = require_string(j, "user_prompt");

    const json& iteration = require_field(j, "iteration");
    if (iteration.is_number_integer()) {
        entry.iteration = iteration.get<int64_t>();
    } else {
        throw DeserializationError("CacheEntry: field 'iteration' must be an integer");
    }

    entry.output = require_string(j, "output");
    if (!json::accept(entry.output)) {
        throw DeserializationError("CacheEntry: field 'output' is not valid JSON");
    }

    auto ts = j.find("timestamp");
    if (ts == j.end() || ts->is_null()) {
        entry.timestamp = epoch_seconds();
    } else if (ts->is_number_unsigned()) {
        entry.timestamp = ts->get<uint64_t>();
    } else if (ts->is_number()) {
        // Older writers stored float seconds.
        auto secs = ts->get<double>();
        if (secs < 0) {
            throw DeserializationError("CacheEntry: field 'timestamp' is negative");
        }
        entry.timestamp = static_cast<uint64_t>(secs);
    } else {
        throw DeserializationError("CacheEntry: field 'timestamp' must be a number");
    }

    auto svc = j.find("service");
    if (svc != j.end() && !svc->is_null()) {
        if (!svc->is_string()) {
            throw DeserializationError("CacheEntry: field 'service' must be a string or null");
        }
        entry.service = svc->get<std::string>();
    }

    auto val = j.find("validated");
    if (val != j.end() && !val->is_null()) {
        if (!val->is_boolean()) {
            throw DeserializationError("CacheEntry: field 'validated' must be a boolean");
        }
        entry.validated = val->get<bool>();
    }

    return entry;
}

FetchInput CacheEntry::fetch_input() const {
    return FetchInput{model, parameters, system_prompt, user_prompt, iteration};
}

StoreInput CacheEntry::store_input() const {
    StoreInput input;
    input.model = model;
    input.parameters = parameters;
    input.system_prompt = system_prompt;
    input.user_prompt = user_prompt;
    input.iteration = iteration;
    input.response = parsed_output();
    input.service = service;
    input.validated = validated;
    return input;
}

json CacheEntry::parsed_output() const {
    try {
        return json::parse(output);
    } catch (const json::parse_error& e) {
        throw DeserializationError("CacheEntry " + key() + ": output is not valid JSON: " +
                                   e.what());
    }
}

bool CacheEntry::operator==(const CacheEntry& other) const {
    return model == other.model &&
           parameters == other.parameters &&
           system_prompt == other.system_prompt &&
           user_prompt == other.user_prompt &&
           iteration == other.iteration &&
           output == other.output &&
           service == other.service &&
           validated == other.validated;
}

CacheEntry CacheEntry::example(const std::string& system_prompt_suffix) {
    CacheEntry entry;
    entry.model = "gpt-3.5-turbo";
    entry.parameters = {{"temperature", 0.5}};
    entry.system_prompt = "The quick brown fox jumps over the lazy dog." + system_prompt_suffix;
    entry.user_prompt = "What does the fox say?";
    entry.iteration = 1;
    entry.output = canonical_json(json("The fox says 'hello'"));
    entry.timestamp = epoch_seconds();
    entry.service = "openai";
    return entry;
}

} // namespace llmcache
