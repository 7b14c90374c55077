#include "embedding_service.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace receipt_assistant {

using json = nlohmann::json;

GeminiEmbeddingGateway::GeminiEmbeddingGateway(EmbeddingConfig config)
    : config_(std::move(config)) {}

std::string GeminiEmbeddingGateway::get_endpoint_url() const {
    return config_.base_url + config_.model + ":embedContent?key=" + config_.api_key;
}

std::vector<float> GeminiEmbeddingGateway::embed(const std::string& text) {
    auto start = std::chrono::steady_clock::now();

    auto r = cpr::Post(cpr::Url{get_endpoint_url()},
                       cpr::Body(json{
                           {"model", "models/" + config_.model},
                           {"content", {{"parts", {{{"text", text}}}}}}
                       }.dump(-1, ' ', false, json::error_handler_t::replace)),
                       cpr::Header{{"Content-Type", "application/json"}},
                       cpr::Timeout{config_.timeout_ms});

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        spdlog::warn("⏱️ Embedding call timed out after {:.0f} ms", duration);
        throw GatewayError(GatewayError::Kind::Timeout,
                           "embedding gateway timed out after " + std::to_string(config_.timeout_ms) + " ms");
    }
    if (r.error) {
        spdlog::warn("⚠️ Embedding transport error: {}", r.error.message);
        throw GatewayError(GatewayError::Kind::Unavailable, "embedding transport error: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::warn("⚠️ Embedding API error [{}]: {}", r.status_code, r.text);
        throw GatewayError(GatewayError::Kind::Unavailable,
                           "embedding API returned HTTP " + std::to_string(r.status_code));
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw GatewayError(GatewayError::Kind::Unavailable,
                           std::string("malformed embedding response: ") + e.what());
    }

    if (static_cast<int>(embedding.size()) != config_.dimension) {
        throw GatewayError(GatewayError::Kind::Unavailable,
                           "embedding has " + std::to_string(embedding.size()) +
                           " components, expected " + std::to_string(config_.dimension));
    }

    spdlog::debug("Embedding generated in {:.1f} ms ({} chars)", duration, text.size());
    return embedding;
}

CachingEmbeddingGateway::CachingEmbeddingGateway(std::shared_ptr<EmbeddingGateway> inner,
                                                 std::shared_ptr<EmbeddingCache> cache)
    : inner_(std::move(inner)), cache_(std::move(cache)) {}

std::vector<float> CachingEmbeddingGateway::embed(const std::string& text) {
    if (auto cached = cache_->lookup(text)) return *cached;

    auto embedding = inner_->embed(text);
    cache_->remember(text, embedding);
    return embedding;
}

} // namespace receipt_assistant
