#include "cache_file.hpp"
#include "snapshot_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace promptcache {

bool load_cache_file(const std::string& path, ResponseCache& cache,
                     const std::optional<SettingsPatch>& settings) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[cache] Ignoring corrupt cache file " << path << ": " << e.what() << "\n";
        return false;
    }

    CacheImport data = import_from_json(j);
    if (settings) data.settings = settings;
    cache.import_cache(data);
    return true;
}

bool save_cache_file(const std::string& path, const ResponseCache& cache) {
    nlohmann::json j = snapshot_to_json(cache.export_cache());
    // Cached text is not guaranteed to be valid UTF-8.
    std::string body = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!atomic_write_file(path, body + "\n")) {
        std::cerr << "[cache] Warning: failed to persist cache file " << path << "\n";
        return false;
    }
    return true;
}

} // namespace promptcache
