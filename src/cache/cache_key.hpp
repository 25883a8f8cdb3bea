#pragma once
#include "cache_types.hpp"
#include <string>
#include <cstdint>

namespace promptcache {

// 64-bit FNV-1a over the raw bytes.
uint64_t fnv1a(const std::string& bytes);

// Hash of the trimmed, lower-cased text as 16 hex digits.
std::string hash_text(const std::string& text);

// Derive the lookup key for a request. Equal inputs after normalisation
// always produce equal keys; temperature is compared at two decimals.
CacheKey derive_key(const std::string& prompt,
                    const std::string& context,
                    const std::string& model,
                    double temperature);

// Rebuild an entry's key from its stored hashes. When either hash is
// missing the prompt is re-hashed and an empty context is assumed.
CacheKey key_from_entry(const CacheEntry& entry);

} // namespace promptcache
