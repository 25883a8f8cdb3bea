#include "cache_key.hpp"
#include "../util.hpp"
#include <cstdio>

namespace promptcache {

uint64_t fnv1a(const std::string& bytes) {
    constexpr uint64_t fnv_offset = 14695981039346656037ULL;
    constexpr uint64_t fnv_prime  = 1099511628211ULL;

    uint64_t hash = fnv_offset;
    for (unsigned char byte : bytes) {
        hash ^= byte;
        hash *= fnv_prime;
    }
    return hash;
}

std::string hash_text(const std::string& text) {
    uint64_t hash = fnv1a(to_lower(trim(text)));
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

CacheKey derive_key(const std::string& prompt,
                    const std::string& context,
                    const std::string& model,
                    double temperature) {
    return CacheKey{hash_text(prompt), hash_text(context), model,
                    format_fixed(temperature, 2)};
}

CacheKey key_from_entry(const CacheEntry& entry) {
    if (!entry.prompt_hash.empty() && !entry.context_hash.empty()) {
        return CacheKey{entry.prompt_hash, entry.context_hash, entry.model,
                        format_fixed(entry.temperature, 2)};
    }
    return derive_key(entry.prompt, "", entry.model, entry.temperature);
}

} // namespace promptcache
