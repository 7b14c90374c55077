#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace receipt_assistant {

struct EmbeddingConfig {
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    std::string model = "text-embedding-004";
    std::string api_key;
    int dimension = 768;
    int timeout_ms = 10000;
    size_t cache_size = 1000;
    int cache_ttl_seconds = 3600;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 5002;
    int threads = 8;
};

struct AppConfig {
    std::string data_dir = "data";
    std::string blob_dir = "data/blobs";
    std::string log_level = "info";
    std::string vector_index = "flat";   // "flat" (exact) or "hnsw"
    size_t retention_window = 3;
    int default_search_limit = 5;
    EmbeddingConfig embedding;
    ServerConfig server;

    // Missing keys keep their defaults. Throws std::invalid_argument on
    // values that cannot work (zero dimension, unknown index kind).
    static AppConfig from_json(const nlohmann::json& j);
};

class ConfigManager {
public:
    // Search order: $RECEIPT_ASSISTANT_CONFIG, then the standard paths.
    // GEMINI_API_KEY in the environment wins over the file's api_key.
    static AppConfig load();
    static AppConfig load_from(const std::string& path);

    static std::optional<std::string> find_config_file();

private:
    static const std::vector<std::string>& search_paths();
    static void apply_environment(AppConfig& config);
};

} // namespace receipt_assistant
