#include "ConfigManager.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace receipt_assistant {

using json = nlohmann::json;

AppConfig AppConfig::from_json(const json& j) {
    AppConfig c;
    c.data_dir = j.value("data_dir", c.data_dir);
    c.blob_dir = j.value("blob_dir", c.data_dir + "/blobs");
    c.log_level = j.value("log_level", c.log_level);
    c.vector_index = j.value("vector_index", c.vector_index);
    c.retention_window = j.value("retention_window", c.retention_window);
    c.default_search_limit = j.value("default_search_limit", c.default_search_limit);

    if (j.contains("embedding")) {
        const auto& e = j["embedding"];
        c.embedding.base_url = e.value("base_url", c.embedding.base_url);
        c.embedding.model = e.value("model", c.embedding.model);
        c.embedding.api_key = e.value("api_key", c.embedding.api_key);
        c.embedding.dimension = e.value("dimension", c.embedding.dimension);
        c.embedding.timeout_ms = e.value("timeout_ms", c.embedding.timeout_ms);
        c.embedding.cache_size = e.value("cache_size", c.embedding.cache_size);
        c.embedding.cache_ttl_seconds = e.value("cache_ttl_seconds", c.embedding.cache_ttl_seconds);
    }

    if (j.contains("server")) {
        const auto& s = j["server"];
        c.server.host = s.value("host", c.server.host);
        c.server.port = s.value("port", c.server.port);
        c.server.threads = s.value("threads", c.server.threads);
    }

    if (c.embedding.dimension <= 0) throw std::invalid_argument("embedding.dimension must be positive");
    if (c.embedding.timeout_ms <= 0) throw std::invalid_argument("embedding.timeout_ms must be positive");
    if (c.vector_index != "flat" && c.vector_index != "hnsw") {
        throw std::invalid_argument("vector_index must be 'flat' or 'hnsw', got '" + c.vector_index + "'");
    }
    if (c.retention_window == 0) throw std::invalid_argument("retention_window must be at least 1");
    if (c.default_search_limit <= 0) throw std::invalid_argument("default_search_limit must be positive");
    return c;
}

const std::vector<std::string>& ConfigManager::search_paths() {
    static const std::vector<std::string> paths = {
        "receipt_assistant.json",           // current working directory
        "../receipt_assistant.json",        // running from build/
        "build/receipt_assistant.json",
        "../../receipt_assistant.json"
    };
    return paths;
}

std::optional<std::string> ConfigManager::find_config_file() {
    if (const char* env = std::getenv("RECEIPT_ASSISTANT_CONFIG")) {
        if (*env) return std::string(env);
    }
    for (const auto& path : search_paths()) {
        std::ifstream f(path);
        if (f.is_open()) return path;
    }
    return std::nullopt;
}

AppConfig ConfigManager::load() {
    auto path = find_config_file();
    if (!path) {
        spdlog::warn("⚠️ receipt_assistant.json not found, running on defaults");
        AppConfig config;
        apply_environment(config);
        return config;
    }
    return load_from(*path);
}

AppConfig ConfigManager::load_from(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open config file: " + path);

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Config file " + path + " is not valid JSON: " + e.what());
    }

    AppConfig config = AppConfig::from_json(j);
    apply_environment(config);
    spdlog::info("⚙️  Config loaded from {} (data_dir={}, index={}, dim={})",
                 path, config.data_dir, config.vector_index, config.embedding.dimension);
    return config;
}

void ConfigManager::apply_environment(AppConfig& config) {
    if (const char* key = std::getenv("GEMINI_API_KEY")) {
        if (*key) config.embedding.api_key = key;
    }
    if (config.embedding.api_key.empty()) {
        spdlog::warn("⚠️ No embedding API key configured; embedding calls will fail");
    }
}

} // namespace receipt_assistant
