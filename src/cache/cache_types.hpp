#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace promptcache {

// Per-entry bookkeeping overhead counted in CacheStats::cache_size.
constexpr uint64_t kEntryOverheadBytes = 200;

constexpr uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

struct CacheKey {
    std::string prompt_hash;
    std::string context_hash;
    std::string model;
    std::string temperature; // fixed two decimals

    // Table key: the four components joined by '_' in that order.
    std::string str() const {
        return prompt_hash + "_" + context_hash + "_" + model + "_" + temperature;
    }

    bool operator==(const CacheKey& other) const { return str() == other.str(); }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }
};

struct CacheEntry {
    std::string id;
    std::string prompt_hash;
    std::string context_hash;
    std::string prompt;
    std::string response;
    std::string model;
    double temperature = 0.0;
    uint64_t tokens_used = 0;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t created_at = 0;  // epoch ms
    uint64_t accessed_at = 0; // epoch ms, never before created_at
    uint64_t access_count = 1;
};

struct CacheStats {
    uint64_t total_entries = 0;
    uint64_t total_hits = 0;
    uint64_t total_misses = 0;
    uint64_t estimated_savings = 0; // tokens
    uint64_t cache_size = 0;        // approximate bytes
};

struct CacheSettings {
    bool enabled = true;
    uint32_t max_entries = 100;
    uint32_t max_age_days = 30;
    double match_threshold = 1.0; // reserved, 1.0 = exact match only
};

// Partial settings update. Absent fields are left unchanged.
struct SettingsPatch {
    std::optional<bool> enabled;
    std::optional<uint32_t> max_entries;
    std::optional<uint32_t> max_age_days;
    std::optional<double> match_threshold;
};

struct CacheSnapshot {
    std::vector<CacheEntry> entries; // most recently accessed first
    CacheStats stats;
    CacheSettings settings;
};

// Possibly incomplete persisted state. Entries with empty hashes get their
// key recomputed from the raw fields.
struct CacheImport {
    std::optional<std::vector<CacheEntry>> entries;
    std::optional<CacheStats> stats;
    std::optional<SettingsPatch> settings;
};

struct PerformanceMetrics {
    double hit_rate = 0.0;            // percent
    double avg_access_count = 0.0;
    uint64_t median_access_count = 0;
    uint64_t total_savings = 0;       // tokens
    double estimated_cost_savings = 0.0;
    double cache_efficiency = 0.0;    // hits per live entry
};

struct CacheQuery {
    std::string prompt;
    std::string context;
    std::string model;
    double temperature = 0.0;
};

struct CacheWrite {
    std::string prompt;
    std::string context;
    std::string model;
    double temperature = 0.0;
    std::string response;
    uint64_t tokens_used = 0;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
};

} // namespace promptcache
