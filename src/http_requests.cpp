#include "http_requests.hpp"
#include "encoding.hpp"
#include <stdexcept>

namespace receipt_assistant {

using json = nlohmann::json;

namespace {

template<typename T>
Result<T> invalid(std::string message) {
    return Result<T>::failure(ErrorCode::InvalidArgument, std::move(message));
}

// Absent and null read as the fallback; any other non-string is rejected.
bool optional_string(const json& body, const char* key, const std::string& fallback, std::string& out) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        out = fallback;
        return true;
    }
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

Result<json> parse_body(const std::string& body) {
    try {
        return Result<json>::success(json::parse(body));
    } catch (const json::parse_error& e) {
        return Result<json>::failure(ErrorCode::InvalidArgument, std::string("body is not JSON: ") + e.what());
    }
}

} // namespace

Result<TurnRequest> parse_turn_request(const json& body) {
    if (!body.is_object()) return invalid<TurnRequest>("body must be a JSON object");

    TurnRequest request;
    std::string role_text;
    if (!optional_string(body, "role", "user", role_text)) {
        return invalid<TurnRequest>("role must be a string");
    }
    auto role = parse_role(role_text);
    if (!role) return invalid<TurnRequest>("role must be 'user' or 'assistant'");
    request.role = *role;

    if (!optional_string(body, "text", "", request.text)) {
        return invalid<TurnRequest>("text must be a string");
    }

    auto images = body.find("images");
    if (images != body.end() && !images->is_null()) {
        if (!images->is_array()) return invalid<TurnRequest>("images must be an array");

        for (size_t i = 0; i < images->size(); ++i) {
            const json& img = (*images)[i];
            std::string where = "images[" + std::to_string(i) + "]";
            if (!img.is_object()) return invalid<TurnRequest>(where + " must be an object");

            auto data = img.find("data");
            if (data == img.end() || !data->is_string()) {
                return invalid<TurnRequest>(where + ".data must be a base64 string");
            }
            InboundImage image;
            if (!optional_string(img, "mime_type", "application/octet-stream", image.mime_type)) {
                return invalid<TurnRequest>(where + ".mime_type must be a string");
            }
            try {
                image.data = base64_decode(data->get<std::string>());
            } catch (const std::invalid_argument& e) {
                return invalid<TurnRequest>(where + ".data: " + e.what());
            }
            request.images.push_back(std::move(image));
        }
    }

    if (request.role == Role::Assistant && !request.images.empty()) {
        return invalid<TurnRequest>("assistant turns carry no images");
    }
    return Result<TurnRequest>::success(std::move(request));
}

Result<TurnRequest> parse_turn_body(const std::string& body) {
    auto parsed = parse_body(body);
    if (!parsed) return Result<TurnRequest>::failure(parsed.error());
    return parse_turn_request(parsed.value());
}

Result<ToolCallRequest> parse_tool_request(const json& body) {
    if (!body.is_object()) return invalid<ToolCallRequest>("body must be a JSON object");

    ToolCallRequest request;
    if (!optional_string(body, "session_id", "", request.session_id)) {
        return invalid<ToolCallRequest>("session_id must be a string");
    }
    if (request.session_id.empty()) return invalid<ToolCallRequest>("session_id is required");

    auto arguments = body.find("arguments");
    if (arguments != body.end() && !arguments->is_null()) {
        if (!arguments->is_object()) return invalid<ToolCallRequest>("arguments must be an object");
        request.arguments = *arguments;
    }
    return Result<ToolCallRequest>::success(std::move(request));
}

Result<ToolCallRequest> parse_tool_body(const std::string& body) {
    auto parsed = parse_body(body);
    if (!parsed) return Result<ToolCallRequest>::failure(parsed.error());
    return parse_tool_request(parsed.value());
}

} // namespace receipt_assistant
