#pragma once
#include <string>
#include <vector>
#include <memory>
#include "embedding_cache.hpp"
#include "ConfigManager.hpp"

namespace receipt_assistant {

// Text -> fixed-dimension vector. Implementations throw GatewayError on
// failure and never retry; retry policy belongs to the caller.
class EmbeddingGateway {
public:
    virtual ~EmbeddingGateway() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
    virtual int dimension() const = 0;
};

// Gemini embedContent over HTTPS, bounded by config.timeout_ms.
class GeminiEmbeddingGateway : public EmbeddingGateway {
public:
    explicit GeminiEmbeddingGateway(EmbeddingConfig config);

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return config_.dimension; }

private:
    EmbeddingConfig config_;
    std::string get_endpoint_url() const;
};

// Serves repeated query texts from an EmbeddingCache; misses go to the inner
// gateway. Failed calls are never cached.
class CachingEmbeddingGateway : public EmbeddingGateway {
public:
    CachingEmbeddingGateway(std::shared_ptr<EmbeddingGateway> inner,
                            std::shared_ptr<EmbeddingCache> cache);

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return inner_->dimension(); }

private:
    std::shared_ptr<EmbeddingGateway> inner_;
    std::shared_ptr<EmbeddingCache> cache_;
};

} // namespace receipt_assistant
