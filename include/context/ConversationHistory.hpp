#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "context/ConversationTypes.hpp"

namespace receipt_assistant {

// Append-only turn list of one session. Turns are never reordered or
// removed; only image payloads are released by apply_retention. Not
// synchronized: the owning Session's mutex guards it.
class ConversationHistory {
public:
    // Returns the index of the new turn. References seen for the first time
    // get this turn as their origin; the origin never changes afterwards.
    size_t append(ConversationTurn turn);

    // Releases payloads outside the window. Returns how many were released.
    size_t apply_retention(size_t window);

    struct LivePayload {
        std::shared_ptr<const Bytes> data;
        std::string mime_type;
    };

    // Newest live copy of the reference, if any.
    std::optional<LivePayload> find_live_payload(const std::string& reference) const;

    std::optional<size_t> origin_turn(const std::string& reference) const;
    bool was_ever_uploaded(const std::string& reference) const;

    // Mime type recorded at upload, or empty.
    std::string mime_type_of(const std::string& reference) const;

    const std::vector<ConversationTurn>& turns() const { return turns_; }
    size_t size() const { return turns_.size(); }

private:
    std::vector<ConversationTurn> turns_;
    std::unordered_map<std::string, size_t> origin_;
};

} // namespace receipt_assistant
