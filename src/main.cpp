#include "config.hpp"
#include "util.hpp"
#include "cache/response_cache.hpp"
#include "cache/cache_file.hpp"
#include "cache/snapshot_json.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: promptcache [options] COMMAND [ARGS]\n"
              << "\n"
              << "Options:\n"
              << "  --cache FILE         Cache file (default: cache.path from config)\n"
              << "  --config FILE        Config file (default: ~/.promptcache/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  stats                Show counters and hit rate\n"
              << "  metrics              Show performance metrics\n"
              << "  list [N]             List entries, most recently accessed first\n"
              << "  frequent [N]         Top N entries by access count\n"
              << "  recent [N]           Top N entries by last access\n"
              << "  prefetch PROMPT [N]  Rank entries likely needed for PROMPT\n"
              << "  invalidate TEXT      Remove entries whose prompt contains TEXT\n"
              << "  delete ID            Remove one entry by id\n"
              << "  clean                Remove expired entries\n"
              << "  optimize             Evict low-value entries when near capacity\n"
              << "  clear                Remove all entries\n"
              << "  reset-stats          Zero hit, miss and savings counters\n"
              << "  set KEY VALUE        Change a cache setting (enabled, max_entries,\n"
              << "                       max_age_days, match_threshold)\n"
              << "  export [FILE]        Write a snapshot to FILE (default: stdout)\n"
              << "  import FILE          Replace the cache with a snapshot from FILE\n"
              << "\n"
              << "Environment variables:\n"
              << "  PROMPTCACHE_CACHE_PATH  Cache file location\n"
              << "  PROMPTCACHE_DISABLED    Disable lookups and stores when set\n";
}

static size_t parse_count(const std::vector<std::string>& args, size_t index, size_t fallback) {
    if (index >= args.size()) return fallback;
    try {
        return static_cast<size_t>(std::stoul(args[index]));
    } catch (const std::logic_error&) {
        throw std::invalid_argument("expected a number, got '" + args[index] + "'");
    }
}

static std::string preview(const std::string& text, size_t width) {
    std::string flat = text;
    for (char& c : flat) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (flat.size() <= width) return flat;
    return flat.substr(0, width - 3) + "...";
}

static void print_entries(const std::vector<promptcache::CacheEntry>& entries) {
    if (entries.empty()) {
        std::cout << "(no entries)\n";
        return;
    }
    for (const auto& e : entries) {
        std::cout << e.id << "  " << e.model << " @" << promptcache::format_fixed(e.temperature, 2)
                  << "  hits=" << e.access_count
                  << "  tokens=" << e.tokens_used
                  << "  " << preview(e.prompt, 60) << "\n";
    }
}

static int run_command(const std::vector<std::string>& args,
                       const promptcache::Config& config,
                       const std::string& config_path,
                       const std::string& cache_path,
                       promptcache::ResponseCache& cache) {
    const std::string& cmd = args[0];
    bool dirty = false;

    if (cmd == "stats") {
        auto s = cache.stats();
        std::cout << "Entries:   " << s.total_entries << "\n"
                  << "Hits:      " << s.total_hits << "\n"
                  << "Misses:    " << s.total_misses << "\n"
                  << "Hit rate:  " << promptcache::format_fixed(cache.hit_rate(), 1) << "%\n"
                  << "Saved:     " << s.estimated_savings << " tokens\n"
                  << "Size:      " << cache.formatted_size() << "\n";
    } else if (cmd == "metrics") {
        auto m = cache.performance_metrics(config.cache.cost_per_1k_tokens);
        std::cout << "Hit rate:           " << promptcache::format_fixed(m.hit_rate, 1) << "%\n"
                  << "Avg access count:   " << promptcache::format_fixed(m.avg_access_count, 2) << "\n"
                  << "Median access:      " << m.median_access_count << "\n"
                  << "Tokens saved:       " << m.total_savings << "\n"
                  << "Est. cost saved:    $" << promptcache::format_fixed(m.estimated_cost_savings, 4) << "\n"
                  << "Hits per entry:     " << promptcache::format_fixed(m.cache_efficiency, 2) << "\n";
    } else if (cmd == "list") {
        auto entries = cache.all_entries();
        size_t n = parse_count(args, 1, entries.size());
        if (entries.size() > n) entries.resize(n);
        print_entries(entries);
    } else if (cmd == "frequent") {
        print_entries(cache.most_frequent_entries(parse_count(args, 1, 10)));
    } else if (cmd == "recent") {
        print_entries(cache.recently_accessed_entries(parse_count(args, 1, 10)));
    } else if (cmd == "prefetch") {
        if (args.size() < 2) throw std::invalid_argument("prefetch requires a prompt");
        print_entries(cache.prefetch_candidates(args[1], parse_count(args, 2, 5)));
    } else if (cmd == "invalidate") {
        if (args.size() < 2) throw std::invalid_argument("invalidate requires text");
        std::cout << "Removed " << cache.invalidate_by_context(args[1]) << " entries.\n";
        dirty = true;
    } else if (cmd == "delete") {
        if (args.size() < 2) throw std::invalid_argument("delete requires an id");
        if (!cache.delete_entry(args[1])) {
            std::cerr << "No entry with id " << args[1] << "\n";
            return 1;
        }
        std::cout << "Deleted " << args[1] << ".\n";
        dirty = true;
    } else if (cmd == "clean") {
        std::cout << "Removed " << cache.clean_expired() << " expired entries.\n";
        dirty = true;
    } else if (cmd == "optimize") {
        std::cout << "Evicted " << cache.optimize() << " entries.\n";
        dirty = true;
    } else if (cmd == "clear") {
        cache.clear();
        std::cout << "Cache cleared.\n";
        dirty = true;
    } else if (cmd == "reset-stats") {
        cache.reset_stats();
        std::cout << "Statistics reset.\n";
        dirty = true;
    } else if (cmd == "set") {
        if (args.size() < 3) throw std::invalid_argument("set requires KEY and VALUE");
        nlohmann::json json_value;
        auto patch = promptcache::parse_cache_setting(args[1], args[2], json_value);
        cache.update_settings(patch);
        bool saved = promptcache::modify_config_json(config_path,
            [&args, &json_value](nlohmann::json& j) {
                if (!j.contains("cache") || !j["cache"].is_object()) {
                    j["cache"] = nlohmann::json::object();
                }
                j["cache"][args[1]] = json_value;
            });
        if (!saved) {
            std::cerr << "Error: failed to update " << config_path << "\n";
            return 1;
        }
        std::cout << args[1] << " = " << json_value.dump() << "\n";
        dirty = true;
    } else if (cmd == "export") {
        std::string body = promptcache::snapshot_to_json(cache.export_cache())
            .dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
        if (args.size() < 2) {
            std::cout << body;
        } else if (!promptcache::atomic_write_file(args[1], body)) {
            std::cerr << "Error: failed to write " << args[1] << "\n";
            return 1;
        }
    } else if (cmd == "import") {
        if (args.size() < 2) throw std::invalid_argument("import requires a file");
        std::ifstream file(args[1]);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open " << args[1] << "\n";
            return 1;
        }
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Error: " << args[1] << " is not valid JSON: " << e.what() << "\n";
            return 1;
        }
        size_t skipped = 0;
        size_t accepted = cache.import_cache(promptcache::import_from_json(j, &skipped));
        std::cout << "Imported " << accepted << " entries";
        if (skipped > 0) std::cout << " (" << skipped << " malformed skipped)";
        std::cout << ".\n";
        dirty = true;
    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }

    if (dirty) {
        if (config.cache.optimize_on_save) cache.optimize();
        if (!promptcache::save_cache_file(cache_path, cache)) return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string cache_path;
    std::string config_path;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--cache") == 0 && i + 1 < argc) {
            cache_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (args.empty() && argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    if (config_path.empty()) config_path = promptcache::expand_home("~/.promptcache/config.json");
    auto config = promptcache::Config::load_from(config_path);
    if (cache_path.empty()) cache_path = config.cache_path();

    // The config file is authoritative over settings stored in the cache file.
    promptcache::SettingsPatch settings{config.cache.enabled, config.cache.max_entries,
                                        config.cache.max_age_days, config.cache.match_threshold};
    promptcache::ResponseCache cache(config.cache_settings());
    if (!promptcache::load_cache_file(cache_path, cache, settings) &&
        std::filesystem::exists(cache_path)) {
        std::cerr << "[cache] Starting with an empty cache\n";
    }

    try {
        return run_command(args, config, config_path, cache_path, cache);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
