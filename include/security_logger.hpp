#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <cctype>

namespace confshield {

// Logs engine events. Callers pass kinds, placeholders, file names and
// counts only; original secret values and key bytes never reach this class.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        STORE_OPENED,
        STORE_PERSISTED,
        STORE_LOCKED,
        INTEGRITY_FAILURE,
        SECRET_REGISTERED,
        PLACEHOLDER_RESTORED,
        PLACEHOLDER_UNRESOLVED,
        PATTERN_CONFIG,
        KEY_MATERIAL
    };

    /**
     * Records an engine event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param location File or store path the event relates to ("internal" if none).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& location,
                   const std::string& message = "") {
        if (static_cast<int>(level) < min_level_ref().load()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "at=" << sanitize_log_message(location);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Events below this level are dropped. Defaults to INFO.
    static void set_min_level(Level level) {
        min_level_ref().store(static_cast<int>(level));
    }

    static Level min_level() {
        return static_cast<Level>(min_level_ref().load());
    }

    // Accepts "info", "warn", "error" and "crit" (case-insensitive); unknown names map to INFO.
    static Level parse_level(const std::string& name) {
        std::string lower;
        for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == "warn" || lower == "warning") return Level::WARNING;
        if (lower == "error") return Level::ERROR;
        if (lower == "crit" || lower == "critical") return Level::CRITICAL;
        return Level::INFO;
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::atomic<int>& min_level_ref() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::STORE_OPENED: return "STORE_OPENED";
            case EventType::STORE_PERSISTED: return "STORE_PERSISTED";
            case EventType::STORE_LOCKED: return "STORE_LOCKED";
            case EventType::INTEGRITY_FAILURE: return "INTEGRITY";
            case EventType::SECRET_REGISTERED: return "SECRET_REGISTERED";
            case EventType::PLACEHOLDER_RESTORED: return "RESTORED";
            case EventType::PLACEHOLDER_UNRESOLVED: return "UNRESOLVED";
            case EventType::PATTERN_CONFIG: return "PATTERN_CONFIG";
            case EventType::KEY_MATERIAL: return "KEY_MATERIAL";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
