#pragma once
#include "cache_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace promptcache {

// JSON <-> cache snapshot conversion used by the cache file and the CLI.
// Field names follow the persisted camelCase layout
// ({entries:[...], stats:{...}, settings:{...}}).

nlohmann::json entry_to_json(const CacheEntry& entry);

// Returns nullopt when the record lacks a field needed to rebuild the
// entry: string prompt, response and model, and a numeric createdAt.
std::optional<CacheEntry> entry_from_json(const nlohmann::json& item);

nlohmann::json stats_to_json(const CacheStats& stats);
CacheStats stats_from_json(const nlohmann::json& j);

nlohmann::json settings_to_json(const CacheSettings& settings);

// Only fields present with the right JSON type end up in the patch.
SettingsPatch settings_patch_from_json(const nlohmann::json& j);

nlohmann::json snapshot_to_json(const CacheSnapshot& snapshot);

// Defensive parse of persisted state. Malformed entries are skipped (and
// counted in `skipped` when given); unknown fields are ignored; a missing
// stats or settings block stays absent.
CacheImport import_from_json(const nlohmann::json& j, size_t* skipped = nullptr);

} // namespace promptcache
