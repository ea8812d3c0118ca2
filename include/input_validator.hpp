#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <vector>
#include <boost/json.hpp>

namespace confshield {

// Validation helpers shared by config parsing, key loading and the store loader.
class InputValidator {
public:
    // Largest text a single sanitize or restore call accepts (64 MiB).
    static constexpr size_t MAX_TEXT_SIZE = 64 * 1024 * 1024;

    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Checks for safe alphanumeric characters (including underscores and hyphens).
    static bool is_valid_alphanumeric(const std::string& str) {
        if (str.empty()) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        });
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with a recursion depth limit. Store payloads and config
     * files are shallow; anything deeper is rejected as malformed.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
