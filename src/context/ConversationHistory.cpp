#include "context/ConversationHistory.hpp"
#include "context/ContextManager.hpp"

namespace receipt_assistant {

size_t ConversationHistory::append(ConversationTurn turn) {
    size_t index = turns_.size();
    for (const auto& slot : turn.images) {
        origin_.emplace(slot.reference, index);   // no-op for known references
    }
    turns_.push_back(std::move(turn));
    return index;
}

size_t ConversationHistory::apply_retention(size_t window) {
    size_t released = 0;
    for (size_t index : ContextManager::turns_to_prune(turns_, window)) {
        for (auto& slot : turns_[index].images) {
            if (!slot.live()) continue;
            slot.payload.reset();
            ++released;
        }
    }
    return released;
}

std::optional<ConversationHistory::LivePayload>
ConversationHistory::find_live_payload(const std::string& reference) const {
    for (size_t i = turns_.size(); i-- > 0;) {
        for (const auto& slot : turns_[i].images) {
            if (slot.reference == reference && slot.live()) {
                return LivePayload{slot.payload, slot.mime_type};
            }
        }
    }
    return std::nullopt;
}

std::optional<size_t> ConversationHistory::origin_turn(const std::string& reference) const {
    auto it = origin_.find(reference);
    if (it == origin_.end()) return std::nullopt;
    return it->second;
}

bool ConversationHistory::was_ever_uploaded(const std::string& reference) const {
    return origin_.count(reference) > 0;
}

std::string ConversationHistory::mime_type_of(const std::string& reference) const {
    auto it = origin_.find(reference);
    if (it == origin_.end()) return "";
    for (const auto& slot : turns_[it->second].images) {
        if (slot.reference == reference) return slot.mime_type;
    }
    return "";
}

} // namespace receipt_assistant
