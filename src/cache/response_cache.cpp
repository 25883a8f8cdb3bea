#include "response_cache.hpp"
#include "cache_key.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace promptcache {

std::string default_entry_id() {
    return "cache_" + std::to_string(epoch_millis()) + "_" + generate_id().substr(0, 9);
}

void validate_settings_patch(const SettingsPatch& patch) {
    if (patch.max_entries && *patch.max_entries < 1) {
        throw std::invalid_argument("max_entries must be at least 1");
    }
    if (patch.match_threshold &&
        !(*patch.match_threshold >= 0.0 && *patch.match_threshold <= 1.0)) {
        throw std::invalid_argument("match_threshold must be within [0, 1]");
    }
}

static SettingsPatch patch_from_settings(const CacheSettings& s) {
    SettingsPatch patch;
    patch.enabled = s.enabled;
    patch.max_entries = s.max_entries;
    patch.max_age_days = s.max_age_days;
    patch.match_threshold = s.match_threshold;
    return patch;
}

ResponseCache::ResponseCache(CacheSettings settings, Clock clock, IdGenerator ids)
    : settings_(settings),
      clock_(clock ? std::move(clock) : Clock(epoch_millis)),
      ids_(ids ? std::move(ids) : IdGenerator(default_entry_id)) {
    validate_settings_patch(patch_from_settings(settings_));
}

CacheEntry ResponseCache::make_entry(const std::string& prompt,
                                     const std::string& context,
                                     const std::string& model,
                                     double temperature,
                                     const std::string& response,
                                     uint64_t tokens_used,
                                     uint64_t input_tokens,
                                     uint64_t output_tokens) const {
    uint64_t now = clock_();
    CacheEntry entry;
    entry.id = ids_();
    entry.prompt_hash = hash_text(prompt);
    entry.context_hash = hash_text(context);
    entry.prompt = prompt;
    entry.response = response;
    entry.model = model;
    entry.temperature = temperature;
    entry.tokens_used = tokens_used;
    entry.input_tokens = input_tokens;
    entry.output_tokens = output_tokens;
    entry.created_at = now;
    entry.accessed_at = now;
    entry.access_count = 1;
    return entry;
}

bool ResponseCache::is_expired(const CacheEntry& entry, uint64_t now) const {
    if (now <= entry.created_at) return false;
    uint64_t max_age_ms = static_cast<uint64_t>(settings_.max_age_days) * kMillisPerDay;
    return (now - entry.created_at) > max_age_ms;
}

void ResponseCache::rebuild_index() {
    key_index_.clear();
    key_index_.reserve(slots_.size());
    for (size_t i = 0; i < slots_.size(); ++i) {
        key_index_[slots_[i].key] = i;
    }
}

void ResponseCache::refresh_stats() {
    uint64_t bytes = 0;
    for (const auto& slot : slots_) {
        bytes += slot.entry.prompt.size() + slot.entry.response.size() + kEntryOverheadBytes;
    }
    stats_.total_entries = slots_.size();
    stats_.cache_size = bytes;
}

void ResponseCache::erase_at(size_t index) {
    slots_.erase(slots_.begin() + static_cast<ptrdiff_t>(index));
    rebuild_index();
}

void ResponseCache::erase_if(const std::function<bool(const CacheEntry&)>& pred,
                             size_t& removed) {
    auto it = std::remove_if(slots_.begin(), slots_.end(),
                             [&pred](const Slot& slot) { return pred(slot.entry); });
    removed = static_cast<size_t>(std::distance(it, slots_.end()));
    slots_.erase(it, slots_.end());
    rebuild_index();
    refresh_stats();
}

void ResponseCache::evict_lru() {
    if (slots_.empty()) return;

    // Strict '<' keeps the earliest inserted entry on ties.
    size_t victim = 0;
    for (size_t i = 1; i < slots_.size(); ++i) {
        if (slots_[i].entry.accessed_at < slots_[victim].entry.accessed_at) {
            victim = i;
        }
    }
    erase_at(victim);
}

void ResponseCache::enforce_capacity() {
    size_t evicted = 0;
    while (slots_.size() > settings_.max_entries) {
        evict_lru();
        evicted++;
    }
    if (evicted > 0) {
        std::cerr << "[cache] Capacity reduced to " << settings_.max_entries
                  << ", evicted " << evicted << " least recently used entries\n";
    }
}

std::optional<CacheEntry> ResponseCache::get(const std::string& prompt,
                                             const std::string& context,
                                             const std::string& model,
                                             double temperature) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!settings_.enabled) return std::nullopt;

    auto it = key_index_.find(derive_key(prompt, context, model, temperature).str());
    if (it == key_index_.end()) {
        stats_.total_misses++;
        return std::nullopt;
    }

    uint64_t now = clock_();
    size_t index = it->second;
    if (is_expired(slots_[index].entry, now)) {
        erase_at(index);
        refresh_stats();
        stats_.total_misses++;
        return std::nullopt;
    }

    CacheEntry& entry = slots_[index].entry;
    entry.accessed_at = std::max(now, entry.created_at);
    entry.access_count++;

    stats_.total_hits++;
    stats_.estimated_savings += entry.tokens_used;

    return entry;
}

CacheEntry ResponseCache::set(const std::string& prompt,
                              const std::string& context,
                              const std::string& model,
                              double temperature,
                              const std::string& response,
                              uint64_t tokens_used,
                              uint64_t input_tokens,
                              uint64_t output_tokens) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry entry = make_entry(prompt, context, model, temperature, response,
                                  tokens_used, input_tokens, output_tokens);
    if (!settings_.enabled) return entry;

    std::string key = derive_key(prompt, context, model, temperature).str();
    auto it = key_index_.find(key);
    if (it != key_index_.end()) {
        // Same request again: replace in place, the count does not grow.
        slots_[it->second].entry = entry;
    } else {
        if (slots_.size() >= settings_.max_entries) {
            evict_lru();
        }
        key_index_[key] = slots_.size();
        slots_.push_back(Slot{std::move(key), entry});
    }

    refresh_stats();
    return entry;
}

std::unordered_map<std::string, CacheEntry> ResponseCache::batch_get(
        const std::vector<CacheQuery>& queries) {
    std::unordered_map<std::string, CacheEntry> results;
    for (const auto& q : queries) {
        auto entry = get(q.prompt, q.context, q.model, q.temperature);
        if (entry) {
            results[derive_key(q.prompt, q.context, q.model, q.temperature).str()] =
                std::move(*entry);
        }
    }
    return results;
}

size_t ResponseCache::batch_set(const std::vector<CacheWrite>& writes) {
    size_t added = 0;
    for (const auto& w : writes) {
        set(w.prompt, w.context, w.model, w.temperature, w.response,
            w.tokens_used, w.input_tokens, w.output_tokens);
        added++;
    }
    return added;
}

bool ResponseCache::delete_entry(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].entry.id == id) {
            erase_at(i);
            refresh_stats();
            return true;
        }
    }
    return false;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
    key_index_.clear();
    refresh_stats();
}

void ResponseCache::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_hits = 0;
    stats_.total_misses = 0;
    stats_.estimated_savings = 0;
}

size_t ResponseCache::optimize() {
    std::lock_guard<std::mutex> lock(mutex_);

    double threshold = static_cast<double>(settings_.max_entries) * 0.8;
    if (static_cast<double>(slots_.size()) <= threshold) return 0;

    uint64_t now = clock_();
    std::vector<std::pair<double, size_t>> scored; // {value, slot index}
    scored.reserve(slots_.size());
    for (size_t i = 0; i < slots_.size(); ++i) {
        const CacheEntry& e = slots_[i].entry;
        double age_days = now > e.accessed_at
            ? static_cast<double>(now - e.accessed_at) / static_cast<double>(kMillisPerDay)
            : 0.0;
        double recency = 1.0 / (1.0 + age_days);
        double popularity = std::min(static_cast<double>(e.access_count) / 100.0, 1.0);
        double size_score = 1.0 / (1.0 + static_cast<double>(e.response.size()) / 1000.0);
        scored.emplace_back(recency * 0.4 + popularity * 0.4 + size_score * 0.2, i);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    // Over-evict by 20% so the next insert does not immediately re-trigger.
    auto to_evict = static_cast<size_t>(
        std::floor((static_cast<double>(slots_.size()) - threshold) * 1.2));
    to_evict = std::min(to_evict, slots_.size());

    std::vector<bool> doomed(slots_.size(), false);
    for (size_t i = 0; i < to_evict; ++i) {
        doomed[scored[i].second] = true;
    }

    std::vector<Slot> kept;
    kept.reserve(slots_.size() - to_evict);
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!doomed[i]) kept.push_back(std::move(slots_[i]));
    }
    slots_ = std::move(kept);
    rebuild_index();
    refresh_stats();

    return to_evict;
}

size_t ResponseCache::clean_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();
    size_t removed = 0;
    erase_if([this, now](const CacheEntry& e) { return is_expired(e, now); }, removed);
    return removed;
}

size_t ResponseCache::invalidate_by_context(const std::string& substring) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    erase_if([&substring](const CacheEntry& e) {
        return e.prompt.find(substring) != std::string::npos;
    }, removed);
    return removed;
}

std::vector<CacheEntry> ResponseCache::prefetch_candidates(const std::string& current_prompt,
                                                           size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto tokens = split_whitespace(to_lower(current_prompt));
    std::unordered_set<std::string> current(tokens.begin(), tokens.end());
    double denom = static_cast<double>(std::max<size_t>(current.size(), 1));

    std::vector<std::pair<double, size_t>> candidates;
    for (size_t i = 0; i < slots_.size(); ++i) {
        const CacheEntry& e = slots_[i].entry;
        auto entry_tokens = split_whitespace(to_lower(e.prompt));
        std::unordered_set<std::string> entry_words(entry_tokens.begin(), entry_tokens.end());

        size_t overlap = 0;
        for (const auto& word : current) {
            if (entry_words.count(word)) overlap++;
        }

        // Popularity is unnormalised and may push the score above 1.
        double score = (static_cast<double>(overlap) / denom) *
                       (static_cast<double>(e.access_count) / 10.0);
        if (score > 0.3) {
            candidates.emplace_back(score, i);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<CacheEntry> result;
    for (size_t i = 0; i < candidates.size() && i < limit; ++i) {
        result.push_back(slots_[candidates[i].second].entry);
    }
    return result;
}

std::vector<CacheEntry> ResponseCache::sorted_entries(
        const std::function<bool(const CacheEntry&, const CacheEntry&)>& before,
        size_t limit) const {
    std::vector<CacheEntry> result;
    result.reserve(slots_.size());
    for (const auto& slot : slots_) {
        result.push_back(slot.entry);
    }
    std::stable_sort(result.begin(), result.end(), before);
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

static bool by_access_count_desc(const CacheEntry& a, const CacheEntry& b) {
    return a.access_count > b.access_count;
}

static bool by_accessed_at_desc(const CacheEntry& a, const CacheEntry& b) {
    return a.accessed_at > b.accessed_at;
}

std::vector<CacheEntry> ResponseCache::most_frequent_entries(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_entries(by_access_count_desc, limit);
}

std::vector<CacheEntry> ResponseCache::recently_accessed_entries(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_entries(by_accessed_at_desc, limit);
}

std::vector<CacheEntry> ResponseCache::all_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_entries(by_accessed_at_desc, slots_.size());
}

CacheStats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats copy = stats_;
    copy.total_entries = slots_.size();
    return copy;
}

double ResponseCache::hit_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = stats_.total_hits + stats_.total_misses;
    if (total == 0) return 0.0;
    return static_cast<double>(stats_.total_hits) / static_cast<double>(total) * 100.0;
}

double ResponseCache::estimated_cost_savings(double cost_per_1k_tokens) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<double>(stats_.estimated_savings) / 1000.0 * cost_per_1k_tokens;
}

PerformanceMetrics ResponseCache::performance_metrics(double cost_per_1k_tokens) const {
    std::lock_guard<std::mutex> lock(mutex_);

    PerformanceMetrics m;
    uint64_t total = stats_.total_hits + stats_.total_misses;
    if (total > 0) {
        m.hit_rate = static_cast<double>(stats_.total_hits) / static_cast<double>(total) * 100.0;
    }

    std::vector<uint64_t> counts;
    counts.reserve(slots_.size());
    for (const auto& slot : slots_) {
        counts.push_back(slot.entry.access_count);
    }
    std::sort(counts.begin(), counts.end());

    if (!counts.empty()) {
        uint64_t sum = 0;
        for (uint64_t c : counts) sum += c;
        m.avg_access_count = static_cast<double>(sum) / static_cast<double>(counts.size());
        m.median_access_count = counts[counts.size() / 2];
        m.cache_efficiency = static_cast<double>(stats_.total_hits) /
                             static_cast<double>(counts.size());
    }

    m.total_savings = stats_.estimated_savings;
    m.estimated_cost_savings =
        static_cast<double>(stats_.estimated_savings) / 1000.0 * cost_per_1k_tokens;
    return m;
}

std::string ResponseCache::formatted_size() const {
    uint64_t bytes = stats().cache_size;
    if (bytes < 1024) return std::to_string(bytes) + " B";
    if (bytes < 1024 * 1024) {
        return format_fixed(static_cast<double>(bytes) / 1024.0, 1) + " KB";
    }
    return format_fixed(static_cast<double>(bytes) / (1024.0 * 1024.0), 1) + " MB";
}

void ResponseCache::update_settings(const SettingsPatch& patch) {
    validate_settings_patch(patch);

    std::lock_guard<std::mutex> lock(mutex_);
    if (patch.enabled) settings_.enabled = *patch.enabled;
    if (patch.max_entries) settings_.max_entries = *patch.max_entries;
    if (patch.max_age_days) settings_.max_age_days = *patch.max_age_days;
    if (patch.match_threshold) settings_.match_threshold = *patch.match_threshold;

    enforce_capacity();
    refresh_stats();
}

CacheSettings ResponseCache::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool ResponseCache::is_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.enabled;
}

void ResponseCache::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.enabled = enabled;
}

CacheSnapshot ResponseCache::export_cache() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheSnapshot snap;
    snap.entries = sorted_entries(by_accessed_at_desc, slots_.size());
    snap.stats = stats_;
    snap.stats.total_entries = slots_.size();
    snap.settings = settings_;
    return snap;
}

size_t ResponseCache::import_cache(const CacheImport& data) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (data.settings) {
        // Overlay onto defaults, not onto the current settings.
        const SettingsPatch& p = *data.settings;
        CacheSettings merged;
        if (p.enabled) merged.enabled = *p.enabled;
        if (p.max_entries) {
            if (*p.max_entries >= 1) {
                merged.max_entries = *p.max_entries;
            } else {
                std::cerr << "[cache] Ignoring imported max_entries=0, using "
                          << merged.max_entries << "\n";
            }
        }
        if (p.max_age_days) merged.max_age_days = *p.max_age_days;
        if (p.match_threshold) {
            if (*p.match_threshold >= 0.0 && *p.match_threshold <= 1.0) {
                merged.match_threshold = *p.match_threshold;
            } else {
                std::cerr << "[cache] Ignoring out-of-range imported match_threshold\n";
            }
        }
        settings_ = merged;
    }

    if (data.stats) {
        stats_ = *data.stats;
    }

    size_t accepted = 0;
    if (data.entries) {
        slots_.clear();
        key_index_.clear();

        uint64_t now = clock_();
        size_t expired = 0;
        size_t truncated = 0;
        const auto& incoming = *data.entries;
        for (size_t i = 0; i < incoming.size(); ++i) {
            if (slots_.size() >= settings_.max_entries) {
                truncated = incoming.size() - i;
                break;
            }
            if (is_expired(incoming[i], now)) {
                expired++;
                continue;
            }

            CacheEntry entry = incoming[i];
            CacheKey key = key_from_entry(entry);
            std::string k = key.str();

            if (entry.prompt_hash.empty() || entry.context_hash.empty()) {
                entry.prompt_hash = key.prompt_hash;
                entry.context_hash = key.context_hash;
            }
            if (entry.id.empty()) entry.id = ids_();
            if (entry.access_count < 1) entry.access_count = 1;
            if (entry.accessed_at < entry.created_at) entry.accessed_at = entry.created_at;

            auto existing = key_index_.find(k);
            if (existing != key_index_.end()) {
                // Later record replaces the earlier one in its slot.
                slots_[existing->second].entry = std::move(entry);
                continue;
            }
            key_index_[k] = slots_.size();
            slots_.push_back(Slot{std::move(k), std::move(entry)});
            accepted++;
        }

        if (expired > 0 || truncated > 0) {
            std::cerr << "[cache] Import dropped " << expired << " expired and "
                      << truncated << " over-capacity entries\n";
        }
    } else {
        enforce_capacity();
    }

    refresh_stats();
    return accepted;
}

size_t ResponseCache::import_cache(const CacheSnapshot& snapshot) {
    CacheImport data;
    data.entries = snapshot.entries;
    data.stats = snapshot.stats;
    data.settings = patch_from_settings(snapshot.settings);
    return import_cache(data);
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace promptcache
