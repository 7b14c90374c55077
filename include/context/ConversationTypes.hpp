#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "encoding.hpp"

namespace receipt_assistant {

enum class Role { User, Assistant };

inline const char* to_string(Role role) {
    return role == Role::User ? "user" : "assistant";
}

inline std::optional<Role> parse_role(const std::string& text) {
    if (text == "user") return Role::User;
    if (text == "assistant") return Role::Assistant;
    return std::nullopt;
}

inline std::string image_marker(const std::string& reference) {
    return "[IMAGE-ID " + reference + "]";
}

// An image as delivered by the transport, before it gets a reference.
struct InboundImage {
    Bytes data;
    std::string mime_type;
};

struct ImageSlot {
    std::string reference;
    std::string mime_type;
    std::shared_ptr<const Bytes> payload;   // null once pruned
    bool had_payload = false;               // survives pruning, for audit

    bool live() const { return payload != nullptr; }
    bool pruned() const { return had_payload && !payload; }
};

// A reference owns exactly one ImageSlot, in its origin turn. Images
// re-uploaded later are kept only as references and render as markers.
struct ConversationTurn {
    Role role = Role::User;
    std::string text;
    std::vector<ImageSlot> images;
    std::vector<std::string> repeated_references;

    bool has_live_image() const {
        for (const auto& slot : images) {
            if (slot.live()) return true;
        }
        return false;
    }
};

struct RenderedImage {
    std::string reference;
    std::string mime_type;
    std::shared_ptr<const Bytes> payload;
};

// What the agent sees for one turn.
struct RenderedTurn {
    Role role = Role::User;
    std::string text;
    std::vector<RenderedImage> attachments;
};

} // namespace receipt_assistant
