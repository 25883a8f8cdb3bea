#include "caching.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace promptcache {

static uint32_t clamp_u32(uint64_t v) {
    return static_cast<uint32_t>(
        std::min<uint64_t>(v, std::numeric_limits<uint32_t>::max()));
}

CachingProvider::CachingProvider(std::unique_ptr<Provider> backend, ResponseCache& cache)
    : backend_(std::move(backend)), cache_(cache) {
    if (!backend_) {
        throw std::invalid_argument("CachingProvider requires a backend provider");
    }
}

CompletionResponse CachingProvider::complete(const std::string& context,
                                             const std::string& prompt,
                                             const std::string& model,
                                             double temperature) {
    if (auto hit = cache_.get(prompt, context, model, temperature)) {
        CompletionResponse resp;
        resp.content = hit->response;
        resp.model = hit->model;
        resp.usage.prompt_tokens = clamp_u32(hit->input_tokens);
        resp.usage.completion_tokens = clamp_u32(hit->output_tokens);
        resp.usage.total_tokens = clamp_u32(hit->tokens_used);
        resp.cached = true;
        return resp;
    }

    // Backend errors propagate; nothing is cached for a failed call.
    CompletionResponse resp = backend_->complete(context, prompt, model, temperature);
    if (!resp.content.empty()) {
        cache_.set(prompt, context, model, temperature, resp.content,
                   resp.usage.total_tokens,
                   resp.usage.prompt_tokens,
                   resp.usage.completion_tokens);
    }
    return resp;
}

std::string CachingProvider::provider_name() const {
    return backend_->provider_name();
}

} // namespace promptcache
