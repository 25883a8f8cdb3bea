#include <catch2/catch_test_macros.hpp>
#include "cache/response_cache.hpp"
#include "cache/snapshot_json.hpp"
#include "cache/cache_file.hpp"
#include "cache/cache_key.hpp"
#include "fake_clock.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace promptcache;

static std::string cache_test_path() {
    return "/tmp/promptcache_test_cache_" + std::to_string(getpid()) + ".json";
}

struct PersistFixture {
    FakeClock clock;
    SequentialIds ids;
    ResponseCache cache{CacheSettings{}, clock.fn(), ids.fn()};
};

struct FileFixture : PersistFixture {
    std::string path = cache_test_path();

    ~FileFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + ".tmp");
    }
};

static CacheEntry raw_entry(const std::string& prompt, uint64_t created_at) {
    CacheEntry e;
    e.id = "raw-" + prompt;
    e.prompt = prompt;
    e.response = "response for " + prompt;
    e.model = "m";
    e.temperature = 0.7;
    e.tokens_used = 10;
    e.created_at = created_at;
    e.accessed_at = created_at;
    e.access_count = 1;
    return e;
}

// ── export_cache ─────────────────────────────────────────────

TEST_CASE("export_cache: empty cache", "[persist]") {
    PersistFixture f;
    auto snap = f.cache.export_cache();
    REQUIRE(snap.entries.empty());
    REQUIRE(snap.stats.total_entries == 0);
    REQUIRE(snap.settings.max_entries == 100);
}

TEST_CASE("export_cache: most recently accessed first, no side effects", "[persist]") {
    PersistFixture f;
    f.cache.set("a", "", "m", 0.0, "r", 1);
    f.clock.advance_ms(1);
    f.cache.set("b", "", "m", 0.0, "r", 1);
    f.clock.advance_ms(1);
    f.cache.get("a", "", "m", 0.0);
    auto stats_before = f.cache.stats();

    auto snap = f.cache.export_cache();
    REQUIRE(snap.entries.size() == 2);
    REQUIRE(snap.entries[0].prompt == "a");
    REQUIRE(snap.entries[1].prompt == "b");
    REQUIRE(snap.stats.total_hits == 1);

    auto stats_after = f.cache.stats();
    REQUIRE(stats_after.total_hits == stats_before.total_hits);
    REQUIRE(stats_after.total_misses == stats_before.total_misses);
}

// ── import_cache ─────────────────────────────────────────────

TEST_CASE("import_cache: export then import leaves state unchanged", "[persist]") {
    PersistFixture f;
    f.cache.set("What is RAII?", "C++ notes", "gpt-4", 0.7, "Scope-bound resources", 40, 15, 25);
    f.clock.advance_ms(5);
    f.cache.set("Explain move semantics", "", "gpt-4", 0.2, "Ownership transfer", 60);
    f.clock.advance_ms(5);
    f.cache.get("What is RAII?", "C++ notes", "gpt-4", 0.7);
    f.cache.get("missing", "", "gpt-4", 0.7);

    auto before = f.cache.export_cache();
    REQUIRE(f.cache.import_cache(before) == 2);
    auto after = f.cache.export_cache();

    REQUIRE(after.entries.size() == before.entries.size());
    for (size_t i = 0; i < before.entries.size(); ++i) {
        const auto& a = before.entries[i];
        const auto& b = after.entries[i];
        REQUIRE(a.id == b.id);
        REQUIRE(a.prompt_hash == b.prompt_hash);
        REQUIRE(a.context_hash == b.context_hash);
        REQUIRE(a.response == b.response);
        REQUIRE(a.created_at == b.created_at);
        REQUIRE(a.accessed_at == b.accessed_at);
        REQUIRE(a.access_count == b.access_count);
    }
    REQUIRE(after.stats.total_hits == before.stats.total_hits);
    REQUIRE(after.stats.total_misses == before.stats.total_misses);
    REQUIRE(after.stats.estimated_savings == before.stats.estimated_savings);
    REQUIRE(after.stats.cache_size == before.stats.cache_size);
    REQUIRE(after.settings.max_entries == before.settings.max_entries);

    // Keys survive: context-bearing entry still hits.
    REQUIRE(f.cache.get("what is raii?", "c++ notes", "gpt-4", 0.7).has_value());
}

TEST_CASE("import_cache: restores into a fresh instance", "[persist]") {
    PersistFixture source;
    source.cache.set("q", "ctx", "m", 0.5, "answer", 12);
    auto snap = source.cache.export_cache();

    PersistFixture target;
    target.clock.now = source.clock.now;
    REQUIRE(target.cache.import_cache(snap) == 1);
    auto hit = target.cache.get("q", "ctx", "m", 0.5);
    REQUIRE(hit.has_value());
    REQUIRE(hit->response == "answer");
}

TEST_CASE("import_cache: drops entries expired under current settings", "[persist]") {
    PersistFixture f;
    uint64_t now = f.clock.now;

    CacheImport data;
    SettingsPatch settings;
    settings.max_age_days = 7;
    data.settings = settings;
    data.entries = std::vector<CacheEntry>{
        raw_entry("fresh", now - 1 * kMillisPerDay),
        raw_entry("stale", now - 8 * kMillisPerDay),
    };

    REQUIRE(f.cache.import_cache(data) == 1);
    REQUIRE(f.cache.size() == 1);
    REQUIRE(f.cache.all_entries()[0].prompt == "fresh");
}

TEST_CASE("import_cache: truncates at max_entries in input order", "[persist]") {
    PersistFixture f;
    uint64_t now = f.clock.now;

    CacheImport data;
    SettingsPatch settings;
    settings.max_entries = 2;
    data.settings = settings;
    data.entries = std::vector<CacheEntry>{
        raw_entry("one", now), raw_entry("two", now), raw_entry("three", now),
    };

    REQUIRE(f.cache.import_cache(data) == 2);
    REQUIRE(f.cache.get("one", "", "m", 0.7).has_value());
    REQUIRE(f.cache.get("two", "", "m", 0.7).has_value());
    REQUIRE_FALSE(f.cache.get("three", "", "m", 0.7).has_value());
}

TEST_CASE("import_cache: settings merge onto defaults, not current values", "[persist]") {
    PersistFixture f;
    SettingsPatch current;
    current.max_entries = 5;
    current.max_age_days = 3;
    f.cache.update_settings(current);

    CacheImport data;
    SettingsPatch incoming;
    incoming.max_age_days = 10;
    data.settings = incoming;
    f.cache.import_cache(data);

    auto s = f.cache.settings();
    REQUIRE(s.max_age_days == 10);
    REQUIRE(s.max_entries == 100);
    REQUIRE(s.enabled);
    REQUIRE(s.match_threshold == 1.0);
}

TEST_CASE("import_cache: invalid imported settings fall back per field", "[persist]") {
    PersistFixture f;
    CacheImport data;
    SettingsPatch incoming;
    incoming.max_entries = 0;
    incoming.match_threshold = 3.0;
    incoming.max_age_days = 9;
    data.settings = incoming;
    f.cache.import_cache(data);

    auto s = f.cache.settings();
    REQUIRE(s.max_entries == 100);
    REQUIRE(s.match_threshold == 1.0);
    REQUIRE(s.max_age_days == 9);
}

TEST_CASE("import_cache: missing blocks keep current state", "[persist]") {
    PersistFixture f;
    f.cache.set("keep", "", "m", 0.0, "r", 1);
    f.cache.get("keep", "", "m", 0.0);

    REQUIRE(f.cache.import_cache(CacheImport{}) == 0);
    REQUIRE(f.cache.size() == 1);
    REQUIRE(f.cache.stats().total_hits == 1);
    REQUIRE(f.cache.settings().max_entries == 100);
}

TEST_CASE("import_cache: stats replaced wholesale, counts recomputed", "[persist]") {
    PersistFixture f;
    CacheImport data;
    CacheStats stats;
    stats.total_entries = 999;
    stats.total_hits = 7;
    stats.total_misses = 3;
    stats.estimated_savings = 420;
    stats.cache_size = 123456;
    data.stats = stats;
    data.entries = std::vector<CacheEntry>{raw_entry("abc", f.clock.now)};

    f.cache.import_cache(data);
    auto s = f.cache.stats();
    REQUIRE(s.total_entries == 1);
    REQUIRE(s.total_hits == 7);
    REQUIRE(s.total_misses == 3);
    REQUIRE(s.estimated_savings == 420);
    REQUIRE(s.cache_size == 3 + std::string("response for abc").size() + kEntryOverheadBytes);
}

TEST_CASE("import_cache: entries without hashes get keys recomputed", "[persist]") {
    PersistFixture f;
    CacheImport data;
    data.entries = std::vector<CacheEntry>{raw_entry("Legacy Prompt", f.clock.now)};

    REQUIRE(f.cache.import_cache(data) == 1);
    auto stored = f.cache.all_entries()[0];
    REQUIRE(stored.prompt_hash == hash_text("Legacy Prompt"));
    REQUIRE(stored.context_hash == hash_text(""));
    REQUIRE(f.cache.get("legacy prompt", "", "m", 0.7).has_value());
}

TEST_CASE("import_cache: repairs access metadata and missing ids", "[persist]") {
    PersistFixture f;
    CacheEntry e = raw_entry("p", f.clock.now - 1000);
    e.id.clear();
    e.access_count = 0;
    e.accessed_at = e.created_at - 500;

    CacheImport data;
    data.entries = std::vector<CacheEntry>{e};
    f.cache.import_cache(data);

    auto stored = f.cache.all_entries()[0];
    REQUIRE(stored.id == "entry-1");
    REQUIRE(stored.access_count == 1);
    REQUIRE(stored.accessed_at == stored.created_at);
}

TEST_CASE("import_cache: later duplicate replaces the earlier record in place", "[persist]") {
    PersistFixture f;
    CacheEntry first = raw_entry("same", f.clock.now);
    first.response = "first";
    CacheEntry other = raw_entry("other", f.clock.now);
    CacheEntry second = raw_entry("SAME", f.clock.now);
    second.id = "later";
    second.response = "second";

    CacheImport data;
    data.entries = std::vector<CacheEntry>{first, other, second};
    REQUIRE(f.cache.import_cache(data) == 2);
    REQUIRE(f.cache.size() == 2);

    // Equal access times keep slot order, so the replacement sits first.
    auto entries = f.cache.all_entries();
    REQUIRE(entries[0].id == "later");
    REQUIRE(entries[1].prompt == "other");
    REQUIRE(f.cache.get("same", "", "m", 0.7)->response == "second");
}

TEST_CASE("import_cache: shrinking capacity without entries evicts LRU", "[persist]") {
    PersistFixture f;
    f.cache.set("a", "", "m", 0.0, "r", 1);
    f.clock.advance_ms(1);
    f.cache.set("b", "", "m", 0.0, "r", 1);
    f.clock.advance_ms(1);
    f.cache.set("c", "", "m", 0.0, "r", 1);

    CacheImport data;
    SettingsPatch s;
    s.max_entries = 2;
    data.settings = s;
    f.cache.import_cache(data);

    REQUIRE(f.cache.size() == 2);
    REQUIRE_FALSE(f.cache.get("a", "", "m", 0.0).has_value());
}

// ── JSON layer ───────────────────────────────────────────────

TEST_CASE("snapshot_to_json: uses persisted field names", "[persist][json]") {
    PersistFixture f;
    f.cache.set("p", "c", "m", 0.25, "r", 3, 1, 2);
    auto j = snapshot_to_json(f.cache.export_cache());

    REQUIRE(j["entries"].is_array());
    const auto& e = j["entries"][0];
    for (const char* field : {"id", "promptHash", "contextHash", "prompt", "response", "model",
                              "temperature", "tokensUsed", "inputTokens", "outputTokens",
                              "createdAt", "accessedAt", "accessCount"}) {
        REQUIRE(e.contains(field));
    }
    REQUIRE(e["tokensUsed"] == 3);
    REQUIRE(j["stats"]["totalEntries"] == 1);
    REQUIRE(j["settings"]["maxEntries"] == 100);
    REQUIRE(j["settings"]["matchThreshold"] == 1.0);
}

TEST_CASE("import_from_json: skips malformed entries and ignores unknown fields", "[persist][json]") {
    auto j = nlohmann::json::parse(R"({
        "entries": [
            {"prompt": "ok", "response": "r", "model": "m", "createdAt": 1000, "extra": true},
            {"prompt": "no response", "model": "m", "createdAt": 1000},
            {"prompt": "bad time", "response": "r", "model": "m", "createdAt": "yesterday"},
            {"prompt": 42, "response": "r", "model": "m", "createdAt": 1000},
            "not an object"
        ],
        "unknownBlock": {}
    })");

    size_t skipped = 0;
    auto data = import_from_json(j, &skipped);
    REQUIRE(skipped == 4);
    REQUIRE(data.entries.has_value());
    REQUIRE(data.entries->size() == 1);
    REQUIRE_FALSE(data.stats.has_value());
    REQUIRE_FALSE(data.settings.has_value());

    const auto& e = data.entries->front();
    REQUIRE(e.prompt == "ok");
    REQUIRE(e.accessed_at == 1000);
    REQUIRE(e.access_count == 1);
    REQUIRE(e.prompt_hash.empty());
}

TEST_CASE("import_from_json: out-of-range numbers are rejected", "[persist][json]") {
    auto j = nlohmann::json::parse(R"({
        "entries": [
            {"prompt": "huge", "response": "r", "model": "m", "createdAt": 1e300},
            {"prompt": "ok", "response": "r", "model": "m", "createdAt": 1000.0,
             "accessCount": 1e300, "tokensUsed": 1.8446744073709552e19}
        ],
        "settings": {"maxAgeDays": 1e300}
    })");

    size_t skipped = 0;
    auto data = import_from_json(j, &skipped);
    REQUIRE(skipped == 1);
    REQUIRE(data.entries->size() == 1);

    const auto& e = data.entries->front();
    REQUIRE(e.prompt == "ok");
    REQUIRE(e.created_at == 1000);
    REQUIRE(e.access_count == 1);
    REQUIRE(e.tokens_used == 0);
    REQUIRE_FALSE(data.settings->max_age_days.has_value());
}

TEST_CASE("import_from_json: partial settings become a partial patch", "[persist][json]") {
    auto j = nlohmann::json::parse(R"({"settings": {"maxEntries": 20, "enabled": "yes"}})");
    auto data = import_from_json(j);
    REQUIRE(data.settings.has_value());
    REQUIRE(data.settings->max_entries == 20u);
    REQUIRE_FALSE(data.settings->enabled.has_value());
    REQUIRE_FALSE(data.settings->max_age_days.has_value());
    REQUIRE_FALSE(data.entries.has_value());
}

TEST_CASE("import_from_json: non-object root is an empty import", "[persist][json]") {
    auto data = import_from_json(nlohmann::json::array());
    REQUIRE_FALSE(data.entries.has_value());
    REQUIRE_FALSE(data.stats.has_value());
    REQUIRE_FALSE(data.settings.has_value());
}

TEST_CASE("import_from_json: round trip through JSON text", "[persist][json]") {
    PersistFixture f;
    f.cache.set("Línea con acentos", "contexto", "m", 0.7, "respuesta", 9);
    f.cache.get("línea con acentos", "contexto", "m", 0.7);

    std::string text = snapshot_to_json(f.cache.export_cache()).dump();

    PersistFixture g;
    g.clock.now = f.clock.now;
    REQUIRE(g.cache.import_cache(import_from_json(nlohmann::json::parse(text))) == 1);
    REQUIRE(g.cache.stats().total_hits == 1);
    REQUIRE(g.cache.get("línea con acentos", "contexto", "m", 0.7).has_value());
}

// ── Cache file ───────────────────────────────────────────────

TEST_CASE("cache file: persists across instances", "[persist][file]") {
    FileFixture f;
    f.cache.set("q", "", "m", 0.0, "r", 5);
    REQUIRE(save_cache_file(f.path, f.cache));

    PersistFixture other;
    other.clock.now = f.clock.now;
    REQUIRE(load_cache_file(f.path, other.cache));
    auto hit = other.cache.get("q", "", "m", 0.0);
    REQUIRE(hit.has_value());
    REQUIRE(hit->response == "r");
}

TEST_CASE("cache file: missing file leaves cache untouched", "[persist][file]") {
    FileFixture f;
    f.cache.set("q", "", "m", 0.0, "r", 5);
    REQUIRE_FALSE(load_cache_file(f.path + ".does-not-exist", f.cache));
    REQUIRE(f.cache.size() == 1);
}

TEST_CASE("cache file: corrupt file leaves cache untouched", "[persist][file]") {
    FileFixture f;
    {
        std::ofstream out(f.path);
        out << "{ not json";
    }
    f.cache.set("q", "", "m", 0.0, "r", 5);
    REQUIRE_FALSE(load_cache_file(f.path, f.cache));
    REQUIRE(f.cache.size() == 1);
}

TEST_CASE("cache file: caller settings replace stored settings before expiry", "[persist][file]") {
    FileFixture f;
    uint64_t five_days_ago = f.clock.now - 5 * kMillisPerDay;
    {
        std::ofstream out(f.path);
        out << R"({"settings": {"maxAgeDays": 1, "maxEntries": 3},
                   "entries": [{"prompt": "old", "response": "r", "model": "m",
                                "temperature": 0.7, "createdAt": )"
            << five_days_ago << "}]}";
    }

    SettingsPatch configured;
    configured.enabled = true;
    configured.max_entries = 50;
    configured.max_age_days = 30;
    configured.match_threshold = 1.0;
    REQUIRE(load_cache_file(f.path, f.cache, configured));

    REQUIRE(f.cache.size() == 1);
    REQUIRE(f.cache.settings().max_age_days == 30);
    REQUIRE(f.cache.settings().max_entries == 50);

    // Without the override the stored one-day limit applies.
    PersistFixture plain;
    plain.clock.now = f.clock.now;
    REQUIRE(load_cache_file(f.path, plain.cache));
    REQUIRE(plain.cache.size() == 0);
    REQUIRE(plain.cache.settings().max_age_days == 1);
}
