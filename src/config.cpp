#include "config.hpp"
#include "util.hpp"
#include "cache/response_cache.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace promptcache {

static const char* kDefaultConfigPath = "~/.promptcache/config.json";
static const char* kDefaultCachePath = "~/.promptcache/cache.json";

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"enabled", true},
            {"max_entries", 100},
            {"max_age_days", 30},
            {"match_threshold", 1.0},
            {"path", ""},
            {"cost_per_1k_tokens", 0.002},
            {"optimize_on_save", false}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    return load_from(expand_home(kDefaultConfigPath));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        nlohmann::json original;
        try {
            original = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << ", using defaults: " << e.what() << "\n";
        }
        file.close();

        if (original.is_object()) {
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                } else {
                    std::cerr << "[config] Warning: failed to migrate " << config_path << "\n";
                }
            }
        } else {
            // Malformed config, fall back to defaults
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("max_entries") && c["max_entries"].is_number_unsigned()) {
            auto v = c["max_entries"].get<uint64_t>();
            if (v >= 1 && v <= UINT32_MAX) cfg.cache.max_entries = static_cast<uint32_t>(v);
        }
        if (c.contains("max_age_days") && c["max_age_days"].is_number_unsigned()) {
            auto v = c["max_age_days"].get<uint64_t>();
            if (v <= UINT32_MAX) cfg.cache.max_age_days = static_cast<uint32_t>(v);
        }
        if (c.contains("match_threshold") && c["match_threshold"].is_number()) {
            double v = c["match_threshold"].get<double>();
            if (v >= 0.0 && v <= 1.0) cfg.cache.match_threshold = v;
        }
        if (c.contains("path") && c["path"].is_string())
            cfg.cache.path = c["path"].get<std::string>();
        if (c.contains("cost_per_1k_tokens") && c["cost_per_1k_tokens"].is_number())
            cfg.cache.cost_per_1k_tokens = c["cost_per_1k_tokens"].get<double>();
        if (c.contains("optimize_on_save") && c["optimize_on_save"].is_boolean())
            cfg.cache.optimize_on_save = c["optimize_on_save"].get<bool>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("PROMPTCACHE_CACHE_PATH"))
        cfg.cache.path = v;
    if (const char* v = std::getenv("PROMPTCACHE_DISABLED")) {
        if (*v != '\0' && std::strcmp(v, "0") != 0) cfg.cache.enabled = false;
    }

    return cfg;
}

std::string Config::cache_path() const {
    return expand_home(cache.path.empty() ? kDefaultCachePath : cache.path);
}

CacheSettings Config::cache_settings() const {
    CacheSettings s;
    s.enabled = cache.enabled;
    s.max_entries = cache.max_entries;
    s.max_age_days = cache.max_age_days;
    s.match_threshold = cache.match_threshold;
    return s;
}

static uint32_t parse_u32(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(key + " must be a non-negative integer");
    }
    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + key);
    }
    if (v > UINT32_MAX) {
        throw std::invalid_argument("value out of range for " + key);
    }
    return static_cast<uint32_t>(v);
}

SettingsPatch parse_cache_setting(const std::string& key, const std::string& value,
                                  nlohmann::json& json_value) {
    SettingsPatch patch;
    if (key == "enabled") {
        if (value != "true" && value != "false") {
            throw std::invalid_argument("enabled must be true or false");
        }
        patch.enabled = (value == "true");
        json_value = *patch.enabled;
    } else if (key == "max_entries") {
        patch.max_entries = parse_u32(key, value);
        json_value = *patch.max_entries;
    } else if (key == "max_age_days") {
        patch.max_age_days = parse_u32(key, value);
        json_value = *patch.max_age_days;
    } else if (key == "match_threshold") {
        size_t used = 0;
        double v = 0.0;
        try {
            v = std::stod(value, &used);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("match_threshold must be a number");
        }
        if (used != value.size()) {
            throw std::invalid_argument("match_threshold must be a number");
        }
        patch.match_threshold = v;
        json_value = v;
    } else {
        throw std::invalid_argument("unknown setting '" + key + "'");
    }
    validate_settings_patch(patch);
    return patch;
}

bool modify_config_json(const std::string& config_path,
                        const std::function<void(nlohmann::json&)>& modifier) {
    nlohmann::json j = nlohmann::json::object();
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Refusing to modify malformed config "
                      << config_path << ": " << e.what() << "\n";
            return false;
        }
        file.close();
    }
    if (!j.is_object()) return false;

    modifier(j);
    return atomic_write_file(config_path, j.dump(4) + "\n");
}

} // namespace promptcache
