#include "engine_config.hpp"
#include "errors.hpp"
#include "input_validator.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

#include <boost/json.hpp>

namespace json = boost::json;

namespace confshield {

namespace {

// Config files are small; anything larger is not a config file.
constexpr size_t kMaxConfigSize = 1024 * 1024;

[[noreturn]] void bad_field(const std::filesystem::path& path, const std::string& field, const char* expected) {
    throw ConfigurationError("config " + path.string() + ": '" + field + "' must be " + expected);
}

std::string get_string(const json::value& v, const std::filesystem::path& path, const std::string& field) {
    if (!v.is_string()) bad_field(path, field, "a string");
    return std::string(v.as_string());
}

bool parse_bool(const std::string& s, bool& out) {
    std::string lower;
    for (char c : s) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

PatternRule parse_rule(const json::value& v, const std::filesystem::path& path, size_t index) {
    const std::string where = "custom_rules[" + std::to_string(index) + "]";
    const json::object* obj = v.if_object();
    if (!obj) bad_field(path, where, "an object");

    PatternRule rule{};
    for (const auto& kv : *obj) {
        std::string key(kv.key());
        if (key == "name") {
            rule.name = get_string(kv.value(), path, where + ".name");
            // Rule names end up in log lines and error messages.
            if (!InputValidator::is_valid_alphanumeric(rule.name)) {
                bad_field(path, where + ".name", "letters, digits, '_' or '-'");
            }
        } else if (key == "kind") {
            std::string kind = get_string(kv.value(), path, where + ".kind");
            auto parsed = kind_from_prefix(kind);
            if (!parsed) {
                throw ConfigurationError("config " + path.string() + ": " + where + " has unknown kind '" + kind + "'");
            }
            rule.kind = *parsed;
        } else if (key == "pattern") {
            rule.pattern = get_string(kv.value(), path, where + ".pattern");
        } else if (key == "case_insensitive") {
            if (!kv.value().is_bool()) bad_field(path, where + ".case_insensitive", "a boolean");
            rule.case_insensitive = kv.value().as_bool();
        } else {
            throw ConfigurationError("config " + path.string() + ": " + where + " has unknown field '" + key + "'");
        }
    }
    if (!obj->contains("kind")) bad_field(path, where + ".kind", "present");
    return rule;
}

}

void EngineConfig::load_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigurationError("config file is not readable: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!InputValidator::is_within_size_limit(content.size(), kMaxConfigSize)) {
        throw ConfigurationError("config file too large: " + path.string());
    }

    json::value root;
    try {
        root = InputValidator::safe_parse_json(content);
    } catch (const std::exception& e) {
        throw ConfigurationError("config file is not valid JSON: " + path.string() + ": " + e.what());
    }

    const json::object* obj = root.if_object();
    if (!obj) {
        throw ConfigurationError("config file must contain a JSON object: " + path.string());
    }

    for (const auto& kv : *obj) {
        std::string key(kv.key());
        const json::value& v = kv.value();
        if (key == "store_path") {
            store_path = get_string(v, path, key);
        } else if (key == "key_path") {
            key_path = get_string(v, path, key);
        } else if (key == "lock_timeout_ms") {
            if (!v.is_int64() || v.as_int64() < 0) bad_field(path, key, "a non-negative integer");
            lock_timeout_ms = v.as_int64();
        } else if (key == "persist_each_file") {
            if (!v.is_bool()) bad_field(path, key, "a boolean");
            persist_each_file = v.as_bool();
        } else if (key == "log_level") {
            log_level = get_string(v, path, key);
        } else if (key == "extra_skip_values") {
            if (!v.is_array()) bad_field(path, key, "an array of strings");
            extra_skip_values.clear();
            for (const auto& item : v.as_array()) {
                extra_skip_values.push_back(get_string(item, path, key));
            }
        } else if (key == "custom_rules") {
            if (!v.is_array()) bad_field(path, key, "an array of rule objects");
            custom_rules.clear();
            size_t index = 0;
            for (const auto& item : v.as_array()) {
                custom_rules.push_back(parse_rule(item, path, index++));
            }
        } else {
            throw ConfigurationError("config " + path.string() + ": unknown field '" + key + "'");
        }
    }
}

void EngineConfig::apply_env() {
    if (const char* e = std::getenv("CONFSHIELD_STORE")) store_path = e;
    if (const char* e = std::getenv("CONFSHIELD_KEY_FILE")) key_path = e;
    if (const char* e = std::getenv("CONFSHIELD_LOG_LEVEL")) log_level = e;

    if (const char* e = std::getenv("CONFSHIELD_LOCK_TIMEOUT_MS")) {
        std::istringstream ss(e);
        int64_t ms = -1;
        if (!(ss >> ms) || !ss.eof() || ms < 0) {
            throw ConfigurationError(std::string("CONFSHIELD_LOCK_TIMEOUT_MS is not a non-negative integer: ") + e);
        }
        lock_timeout_ms = ms;
    }

    if (const char* e = std::getenv("CONFSHIELD_PERSIST_EACH_FILE")) {
        if (!parse_bool(e, persist_each_file)) {
            throw ConfigurationError(std::string("CONFSHIELD_PERSIST_EACH_FILE is not a boolean: ") + e);
        }
    }
}

}
