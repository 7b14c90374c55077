#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>

#include "ConfigManager.hpp"
#include "LogManager.hpp"
#include "blob_gateway.hpp"
#include "context/ContextCompactor.hpp"
#include "context/SessionRegistry.hpp"
#include "embedding_cache.hpp"
#include "embedding_service.hpp"
#include "encoding.hpp"
#include "http_requests.hpp"
#include "receipt_store.hpp"
#include "tools/ReceiptTools.hpp"
#include "tools/ToolRegistry.hpp"

using json = nlohmann::json;
using namespace receipt_assistant;

namespace {

json render_to_json(const std::vector<RenderedTurn>& view, bool include_payloads) {
    json turns = json::array();
    for (const auto& turn : view) {
        json attachments = json::array();
        for (const auto& a : turn.attachments) {
            json item = {{"reference", a.reference}, {"mime_type", a.mime_type}};
            if (include_payloads && a.payload) item["data"] = base64_encode(*a.payload);
            attachments.push_back(std::move(item));
        }
        turns.push_back({{"role", to_string(turn.role)}, {"text", turn.text}, {"attachments", attachments}});
    }
    return turns;
}

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, int status, const Error& error) {
    send_json(res, status, error_envelope(error));
}

} // namespace

class ReceiptAssistantServer {
public:
    explicit ReceiptAssistantServer(const AppConfig& config)
        : config_(config),
          log_manager_(std::make_shared<LogManager>()),
          tool_registry_(log_manager_)
    {
        embedding_cache_ = std::make_shared<EmbeddingCache>(
            config.embedding.cache_size, std::chrono::seconds(config.embedding.cache_ttl_seconds));
        auto gemini = std::make_shared<GeminiEmbeddingGateway>(config.embedding);
        auto embeddings = std::make_shared<CachingEmbeddingGateway>(gemini, embedding_cache_);

        blobs_ = std::make_shared<FileBlobGateway>(config.blob_dir);
        store_ = std::make_shared<ReceiptStore>(embeddings, config.data_dir,
                                                FaissVectorStore::parse_kind(config.vector_index));
        compactor_ = std::make_shared<ContextCompactor>(store_, blobs_, config.retention_window);
        tools_ = std::make_shared<ReceiptTools>(store_, compactor_, blobs_, config.default_search_limit);
        tools_->register_all(tool_registry_);

        server_.new_task_queue = [threads = config.server.threads] {
            return new httplib::ThreadPool(static_cast<size_t>(threads));
        };
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Receipt assistant listening on {}:{} ({} receipts loaded)",
                     config_.server.host, config_.server.port, store_->size());
        return server_.listen(config_.server.host, config_.server.port);
    }

private:
    AppConfig config_;
    httplib::Server server_;
    std::shared_ptr<LogManager> log_manager_;
    ToolRegistry tool_registry_;
    SessionRegistry sessions_;

    std::shared_ptr<EmbeddingCache> embedding_cache_;
    std::shared_ptr<BlobGateway> blobs_;
    std::shared_ptr<ReceiptStore> store_;
    std::shared_ptr<ContextCompactor> compactor_;
    std::shared_ptr<ReceiptTools> tools_;

    void setup_routes() {
        server_.Post("/api/sessions/:session_id/turns", [this](const httplib::Request& req, httplib::Response& res) {
            handle_turn(req, res);
        });

        server_.Get("/api/sessions/:session_id/view", [this](const httplib::Request& req, httplib::Response& res) {
            auto session = sessions_.find(req.path_params.at("session_id"));
            if (!session) {
                send_error(res, 404, {ErrorCode::NotFound, "unknown session"});
                return;
            }
            bool include_payloads = req.get_param_value("payloads") != "false";
            send_json(res, 200, {{"turns", render_to_json(compactor_->render(*session), include_payloads)}});
        });

        server_.Delete("/api/sessions/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
            bool removed = sessions_.evict(req.path_params.at("session_id"));
            send_json(res, removed ? 200 : 404, {{"evicted", removed}});
        });

        server_.Get("/api/tools", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, tool_registry_.get_manifest_json());
        });

        server_.Post("/api/tools/:tool_name", [this](const httplib::Request& req, httplib::Response& res) {
            handle_tool(req, res);
        });

        server_.Get("/api/admin/tool-log", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, {{"traces", log_manager_->get_traces_json()}, {"receipts", store_->size()},
                                 {"sessions", sessions_.size()}, {"embedding_cache", embedding_cache_->stats_json()}});
        });
    }

    void handle_turn(const httplib::Request& req, httplib::Response& res) {
        auto request = parse_turn_body(req.body);
        if (!request) {
            send_error(res, 400, request.error());
            return;
        }
        TurnRequest& turn = request.value();

        auto session = sessions_.open(req.path_params.at("session_id"));

        AppendResult appended;
        if (turn.role == Role::User) {
            auto result = compactor_->record_user_turn(*session, std::move(turn.text), std::move(turn.images));
            if (!result) {
                send_error(res, 400, result.error());
                return;
            }
            appended = result.value();
        } else {
            appended = compactor_->record_assistant_turn(*session, std::move(turn.text));
        }

        send_json(res, 200, {
            {"turn_index", appended.turn_index},
            {"references", appended.references},
            {"repeated_references", appended.repeated_references},
            {"released_payloads", appended.released_payloads},
            {"turns", render_to_json(compactor_->render(*session), false)}
        });
    }

    void handle_tool(const httplib::Request& req, httplib::Response& res) {
        auto request = parse_tool_body(req.body);
        if (!request) {
            send_error(res, 400, request.error());
            return;
        }
        auto session = sessions_.open(request.value().session_id);

        // Tool failures are results, not transport errors.
        send_json(res, 200, tool_registry_.dispatch(req.path_params.at("tool_name"), *session, request.value().arguments));
    }
};

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    try {
        AppConfig config = ConfigManager::load();
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        ReceiptAssistantServer server(config);
        if (!server.run()) {
            spdlog::critical("💥 Could not bind {}:{}", config.server.host, config.server.port);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::critical("💥 Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
