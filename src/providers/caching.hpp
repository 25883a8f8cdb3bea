#pragma once
#include "../provider.hpp"
#include "../cache/response_cache.hpp"
#include <string>
#include <memory>

namespace promptcache {

// Serves repeated requests from a ResponseCache and forwards misses to the
// wrapped backend. The cache must outlive this provider.
class CachingProvider : public Provider {
public:
    CachingProvider(std::unique_ptr<Provider> backend, ResponseCache& cache);

    CompletionResponse complete(const std::string& context,
                               const std::string& prompt,
                               const std::string& model,
                               double temperature) override;

    std::string provider_name() const override;

private:
    std::unique_ptr<Provider> backend_;
    ResponseCache& cache_;
};

} // namespace promptcache
