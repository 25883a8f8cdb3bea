#pragma once
#include "response_cache.hpp"
#include <optional>
#include <string>

namespace promptcache {

// Load a snapshot file into `cache`. Returns false (cache untouched) when
// the file is missing or unparseable. A given `settings` replaces the
// file's stored settings, so expiry and capacity on load follow it.
bool load_cache_file(const std::string& path, ResponseCache& cache,
                     const std::optional<SettingsPatch>& settings = std::nullopt);

// Persist cache.export_cache() as JSON via an atomic rename.
bool save_cache_file(const std::string& path, const ResponseCache& cache);

} // namespace promptcache
