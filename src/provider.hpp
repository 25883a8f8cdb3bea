#pragma once
#include <string>
#include <cstdint>

namespace promptcache {

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct CompletionResponse {
    std::string content;
    TokenUsage usage;
    std::string model;
    bool cached = false; // served from the response cache
};

// Abstract completion backend. Implementations may throw on transport or
// API errors.
class Provider {
public:
    virtual ~Provider() = default;

    virtual CompletionResponse complete(const std::string& context,
                                       const std::string& prompt,
                                       const std::string& model,
                                       double temperature) = 0;

    virtual std::string provider_name() const = 0;
};

} // namespace promptcache
