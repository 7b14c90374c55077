#pragma once
#include <string>
#include <map>
#include <functional>
#include <memory>
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "LogManager.hpp"
#include "errors.hpp"
#include "context/SessionRegistry.hpp"

namespace receipt_assistant {

struct ToolMetadata {
    std::string name;
    std::string description;
    nlohmann::json parameter_schema;
};

inline nlohmann::json ok_envelope(nlohmann::json result) {
    return nlohmann::json{{"result", std::move(result)}, {"error", nullptr}};
}

inline nlohmann::json error_envelope(const Error& error) {
    return nlohmann::json{
        {"result", nullptr},
        {"error", {{"code", to_string(error.code)}, {"message", error.message}}}
    };
}

// A tool answers with an envelope: {"result": ..., "error": null} or
// {"result": null, "error": {"code", "message"}}.
class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() const = 0;
    virtual nlohmann::json execute(Session& session, const nlohmann::json& args) = 0;
};

class GenericTool : public ITool {
    ToolMetadata meta_;
    std::function<nlohmann::json(Session&, const nlohmann::json&)> action_;
public:
    GenericTool(std::string name, std::string desc, nlohmann::json schema,
                std::function<nlohmann::json(Session&, const nlohmann::json&)> action)
        : meta_{std::move(name), std::move(desc), std::move(schema)}, action_(std::move(action)) {}

    ToolMetadata get_metadata() const override { return meta_; }
    nlohmann::json execute(Session& session, const nlohmann::json& args) override {
        return action_(session, args);
    }
};

// Registration happens at startup; dispatch is safe to call concurrently
// afterwards.
class ToolRegistry {
private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
    std::shared_ptr<LogManager> log_manager_;

public:
    explicit ToolRegistry(std::shared_ptr<LogManager> log_manager = std::make_shared<LogManager>())
        : log_manager_(std::move(log_manager)) {}

    void register_tool(std::unique_ptr<ITool> tool) {
        auto name = tool->get_metadata().name;
        spdlog::info("🛰️ Tool registered: {}", name);
        tools_[name] = std::move(tool);
    }

    bool has_tool(const std::string& name) const { return tools_.count(name) > 0; }

    nlohmann::json get_manifest_json() const {
        auto manifest = nlohmann::json::array();
        for (const auto& [name, tool] : tools_) {
            auto meta = tool->get_metadata();
            manifest.push_back({
                {"name", meta.name},
                {"description", meta.description},
                {"parameters", meta.parameter_schema}
            });
        }
        return manifest;
    }

    nlohmann::json dispatch(const std::string& name, Session& session, const nlohmann::json& args) {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            spdlog::warn("⚠️ Unknown tool requested: {}", name);
            return error_envelope({ErrorCode::InvalidArgument, "unknown tool '" + name + "'"});
        }

        auto start = std::chrono::steady_clock::now();
        nlohmann::json envelope = it->second->execute(session, args);
        double duration = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();

        std::string outcome = "ok";
        if (envelope.contains("error") && envelope["error"].is_object()) {
            outcome = envelope["error"].value("code", "Unknown");
        }

        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        log_manager_->add_trace({now_ms, session.id, name, outcome, duration});
        spdlog::info("🔧 {} [{}] -> {} ({:.1f} ms)", name, session.id, outcome, duration);
        return envelope;
    }

    std::shared_ptr<LogManager> log_manager() const { return log_manager_; }
};

} // namespace receipt_assistant
