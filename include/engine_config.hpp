#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pattern_catalog.hpp"

namespace confshield {

// Engine settings. Defaults, then an optional JSON file, then CONFSHIELD_*
// environment variables, then CLI flags.
struct EngineConfig {
    // --- Mapping Store ---
    // Both paths must live outside any version-controlled tree.
    std::filesystem::path store_path = "./secrets/secrets_vault.enc";
    std::filesystem::path key_path = "./secrets/.encryption_key";
    int64_t lock_timeout_ms = 0;   // 0 fails immediately with StoreLockedError
    bool persist_each_file = false;

    // --- Detection ---
    std::vector<std::string> extra_skip_values = {};
    std::vector<PatternRule> custom_rules = {};

    // --- Logging ---
    std::string log_level = "info";

    /**
     * Overlays fields present in a JSON config file:
     *
     *   { "store_path": "...", "key_path": "...", "lock_timeout_ms": 500,
     *     "persist_each_file": true, "log_level": "warn",
     *     "extra_skip_values": ["demo"],
     *     "custom_rules": [{"name": "...", "kind": "API_TOKEN",
     *                       "pattern": "...", "case_insensitive": false}] }
     *
     * @throws ConfigurationError if the file is unreadable, malformed or has
     *         a field of the wrong type or an unknown kind.
     */
    void load_file(const std::filesystem::path& path);

    // Overrides from CONFSHIELD_STORE, CONFSHIELD_KEY_FILE,
    // CONFSHIELD_LOCK_TIMEOUT_MS, CONFSHIELD_PERSIST_EACH_FILE and
    // CONFSHIELD_LOG_LEVEL. Throws ConfigurationError on unparsable numbers.
    void apply_env();
};

}
