#include "snapshot_json.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

namespace promptcache {

// Non-negative JSON number as uint64, or nullopt for anything else.
static std::optional<uint64_t> as_u64(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        int64_t v = it->get<int64_t>();
        if (v >= 0) return static_cast<uint64_t>(v);
        return std::nullopt;
    }
    if (it->is_number_float()) {
        double v = it->get<double>();
        // 2^64; anything at or above it does not fit.
        if (std::isfinite(v) && v >= 0.0 && v < 18446744073709551616.0) {
            return static_cast<uint64_t>(v);
        }
    }
    return std::nullopt;
}

static std::string string_or(const nlohmann::json& item, const char* key,
                             const std::string& fallback) {
    auto it = item.find(key);
    if (it != item.end() && it->is_string()) return it->get<std::string>();
    return fallback;
}

nlohmann::json entry_to_json(const CacheEntry& entry) {
    return {
        {"id", entry.id},
        {"promptHash", entry.prompt_hash},
        {"contextHash", entry.context_hash},
        {"prompt", entry.prompt},
        {"response", entry.response},
        {"model", entry.model},
        {"temperature", entry.temperature},
        {"tokensUsed", entry.tokens_used},
        {"inputTokens", entry.input_tokens},
        {"outputTokens", entry.output_tokens},
        {"createdAt", entry.created_at},
        {"accessedAt", entry.accessed_at},
        {"accessCount", entry.access_count}
    };
}

std::optional<CacheEntry> entry_from_json(const nlohmann::json& item) {
    if (!item.is_object()) return std::nullopt;

    for (const char* required : {"prompt", "response", "model"}) {
        auto it = item.find(required);
        if (it == item.end() || !it->is_string()) return std::nullopt;
    }
    auto created = as_u64(item, "createdAt");
    if (!created) return std::nullopt;

    CacheEntry entry;
    entry.id = string_or(item, "id", "");
    entry.prompt_hash = string_or(item, "promptHash", "");
    entry.context_hash = string_or(item, "contextHash", "");
    entry.prompt = item["prompt"].get<std::string>();
    entry.response = item["response"].get<std::string>();
    entry.model = item["model"].get<std::string>();
    if (item.contains("temperature") && item["temperature"].is_number())
        entry.temperature = item["temperature"].get<double>();
    entry.tokens_used = as_u64(item, "tokensUsed").value_or(0);
    entry.input_tokens = as_u64(item, "inputTokens").value_or(0);
    entry.output_tokens = as_u64(item, "outputTokens").value_or(0);
    entry.created_at = *created;
    entry.accessed_at = as_u64(item, "accessedAt").value_or(entry.created_at);
    entry.access_count = as_u64(item, "accessCount").value_or(1);
    return entry;
}

nlohmann::json stats_to_json(const CacheStats& stats) {
    return {
        {"totalEntries", stats.total_entries},
        {"totalHits", stats.total_hits},
        {"totalMisses", stats.total_misses},
        {"estimatedSavings", stats.estimated_savings},
        {"cacheSize", stats.cache_size}
    };
}

CacheStats stats_from_json(const nlohmann::json& j) {
    CacheStats stats;
    stats.total_entries = as_u64(j, "totalEntries").value_or(0);
    stats.total_hits = as_u64(j, "totalHits").value_or(0);
    stats.total_misses = as_u64(j, "totalMisses").value_or(0);
    stats.estimated_savings = as_u64(j, "estimatedSavings").value_or(0);
    stats.cache_size = as_u64(j, "cacheSize").value_or(0);
    return stats;
}

nlohmann::json settings_to_json(const CacheSettings& settings) {
    return {
        {"enabled", settings.enabled},
        {"maxEntries", settings.max_entries},
        {"maxAgeDays", settings.max_age_days},
        {"matchThreshold", settings.match_threshold}
    };
}

SettingsPatch settings_patch_from_json(const nlohmann::json& j) {
    SettingsPatch patch;
    if (!j.is_object()) return patch;

    if (j.contains("enabled") && j["enabled"].is_boolean())
        patch.enabled = j["enabled"].get<bool>();
    if (auto v = as_u64(j, "maxEntries"))
        patch.max_entries = static_cast<uint32_t>(std::min<uint64_t>(*v, UINT32_MAX));
    if (auto v = as_u64(j, "maxAgeDays"))
        patch.max_age_days = static_cast<uint32_t>(std::min<uint64_t>(*v, UINT32_MAX));
    if (j.contains("matchThreshold") && j["matchThreshold"].is_number())
        patch.match_threshold = j["matchThreshold"].get<double>();
    return patch;
}

nlohmann::json snapshot_to_json(const CacheSnapshot& snapshot) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : snapshot.entries) {
        entries.push_back(entry_to_json(entry));
    }
    return {
        {"entries", entries},
        {"stats", stats_to_json(snapshot.stats)},
        {"settings", settings_to_json(snapshot.settings)}
    };
}

CacheImport import_from_json(const nlohmann::json& j, size_t* skipped) {
    CacheImport data;
    size_t bad = 0;
    if (!j.is_object()) {
        if (skipped) *skipped = 0;
        return data;
    }

    if (j.contains("settings") && j["settings"].is_object()) {
        data.settings = settings_patch_from_json(j["settings"]);
    }
    if (j.contains("stats") && j["stats"].is_object()) {
        data.stats = stats_from_json(j["stats"]);
    }
    if (j.contains("entries") && j["entries"].is_array()) {
        std::vector<CacheEntry> entries;
        entries.reserve(j["entries"].size());
        for (const auto& item : j["entries"]) {
            auto entry = entry_from_json(item);
            if (!entry) {
                bad++;
                continue;
            }
            entries.push_back(std::move(*entry));
        }
        data.entries = std::move(entries);
    }

    if (bad > 0) {
        std::cerr << "[snapshot] Skipped " << bad << " malformed cache entries\n";
    }
    if (skipped) *skipped = bad;
    return data;
}

} // namespace promptcache
