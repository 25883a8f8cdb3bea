#pragma once
#include "cache/cache_types.hpp"
#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace promptcache {

struct CacheConfig {
    bool enabled = true;
    uint32_t max_entries = 100;
    uint32_t max_age_days = 30;
    double match_threshold = 1.0;     // reserved, exact match only
    std::string path;                 // empty = ~/.promptcache/cache.json
    double cost_per_1k_tokens = 0.002;
    bool optimize_on_save = false;    // run optimize() before persisting
};

struct Config {
    CacheConfig cache;

    // Load from ~/.promptcache/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created
    // from defaults; malformed JSON falls back to defaults.
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved cache file path (cache.path or the default location)
    std::string cache_path() const;

    CacheSettings cache_settings() const;
};

// Parse one `cache` setting given as text (`set KEY VALUE` on the CLI).
// Fills `json_value` with the typed value for the config file. Throws
// std::invalid_argument for unknown keys and malformed or out-of-range values.
SettingsPatch parse_cache_setting(const std::string& key, const std::string& value,
                                  nlohmann::json& json_value);

// Read-modify-write a config file atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::string& config_path,
                        const std::function<void(nlohmann::json&)>& modifier);

} // namespace promptcache
