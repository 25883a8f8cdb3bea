#pragma once
#include "cache_types.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <cstdint>
#include <optional>

namespace promptcache {

// Returns the current time as epoch milliseconds.
using Clock = std::function<uint64_t()>;

// Returns a fresh, unique entry id.
using IdGenerator = std::function<std::string()>;

// Default id: "cache_<epoch ms>_<random hex>".
std::string default_entry_id();

// In-memory response cache keyed by normalised request parameters.
// Every public method takes the single internal lock for its full duration,
// and every returned entry is a copy.
class ResponseCache {
public:
    explicit ResponseCache(CacheSettings settings = {},
                           Clock clock = nullptr,
                           IdGenerator ids = nullptr);

    // Look up a cached response. Returns nullopt on miss. Expired entries
    // are erased by the lookup that finds them.
    std::optional<CacheEntry> get(const std::string& prompt,
                                  const std::string& context,
                                  const std::string& model,
                                  double temperature);

    // Store a response. When disabled the entry is built but not stored.
    CacheEntry set(const std::string& prompt,
                   const std::string& context,
                   const std::string& model,
                   double temperature,
                   const std::string& response,
                   uint64_t tokens_used,
                   uint64_t input_tokens = 0,
                   uint64_t output_tokens = 0);

    // Hits only, keyed by CacheKey::str(). Each query counts as a get().
    std::unordered_map<std::string, CacheEntry> batch_get(const std::vector<CacheQuery>& queries);

    size_t batch_set(const std::vector<CacheWrite>& writes);

    bool delete_entry(const std::string& id);
    void clear();
    void reset_stats();

    // Evict low-value entries once the table is over 80% of capacity.
    // Returns the number evicted.
    size_t optimize();

    // Remove every entry older than max_age_days. Returns count removed.
    size_t clean_expired();

    // Remove every entry whose prompt contains `substring`. Returns count removed.
    size_t invalidate_by_context(const std::string& substring);

    std::vector<CacheEntry> prefetch_candidates(const std::string& current_prompt,
                                                size_t limit = 5) const;

    std::vector<CacheEntry> most_frequent_entries(size_t limit = 10) const;
    std::vector<CacheEntry> recently_accessed_entries(size_t limit = 10) const;
    std::vector<CacheEntry> all_entries() const;

    CacheStats stats() const;
    double hit_rate() const; // percent
    double estimated_cost_savings(double cost_per_1k_tokens = 0.002) const;
    PerformanceMetrics performance_metrics(double cost_per_1k_tokens = 0.002) const;
    std::string formatted_size() const;

    // Validates every present field, then applies. Throws
    // std::invalid_argument without changing anything if a field is out of
    // range. Shrinking max_entries evicts LRU entries within the same call.
    void update_settings(const SettingsPatch& patch);
    CacheSettings settings() const;
    bool is_enabled() const;
    void set_enabled(bool enabled);

    CacheSnapshot export_cache() const;

    // Rebuild from persisted state. A later record with the same key replaces
    // an earlier one in place. Returns the number of distinct entries loaded.
    size_t import_cache(const CacheImport& data);
    size_t import_cache(const CacheSnapshot& snapshot);

    size_t size() const;

private:
    struct Slot {
        std::string key;
        CacheEntry entry;
    };

    CacheEntry make_entry(const std::string& prompt,
                          const std::string& context,
                          const std::string& model,
                          double temperature,
                          const std::string& response,
                          uint64_t tokens_used,
                          uint64_t input_tokens,
                          uint64_t output_tokens) const;

    // All of the following must be called with mutex_ held.
    bool is_expired(const CacheEntry& entry, uint64_t now) const;
    void erase_at(size_t index);
    void erase_if(const std::function<bool(const CacheEntry&)>& pred, size_t& removed);
    void evict_lru();
    void enforce_capacity();
    void rebuild_index();
    void refresh_stats();
    std::vector<CacheEntry> sorted_entries(
        const std::function<bool(const CacheEntry&, const CacheEntry&)>& before,
        size_t limit) const;

    CacheSettings settings_;
    CacheStats stats_;
    Clock clock_;
    IdGenerator ids_;
    std::vector<Slot> slots_;                           // insertion order
    std::unordered_map<std::string, size_t> key_index_; // key -> slots_ index
    mutable std::mutex mutex_;
};

// Throws std::invalid_argument if any present field is out of range.
void validate_settings_patch(const SettingsPatch& patch);

} // namespace promptcache
