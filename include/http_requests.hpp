#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "context/ConversationTypes.hpp"
#include "errors.hpp"

namespace receipt_assistant {

// POST /api/sessions/:id/turns
// {"role": "user"|"assistant", "text": "...", "images": [{"data": base64, "mime_type": "..."}]}
struct TurnRequest {
    Role role = Role::User;
    std::string text;
    std::vector<InboundImage> images;
};

// POST /api/tools/:name
// {"session_id": "...", "arguments": {...}}
struct ToolCallRequest {
    std::string session_id;
    nlohmann::json arguments = nlohmann::json::object();
};

// The parsers check the body shape and every field type before reading it,
// so a malformed request becomes InvalidArgument and never an exception.
Result<TurnRequest> parse_turn_request(const nlohmann::json& body);
Result<ToolCallRequest> parse_tool_request(const nlohmann::json& body);

// Raw request bodies; text that is not JSON is InvalidArgument too.
Result<TurnRequest> parse_turn_body(const std::string& body);
Result<ToolCallRequest> parse_tool_body(const std::string& body);

} // namespace receipt_assistant
