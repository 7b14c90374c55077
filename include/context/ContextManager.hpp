#pragma once
#include <string>
#include <vector>
#include "context/ConversationTypes.hpp"

namespace receipt_assistant {

// Retention and rendering policy over a turn list. Both functions are pure;
// ConversationHistory applies the pruning decision to its own turns.
class ContextManager {
public:
    static constexpr size_t kDefaultRetentionWindow = 3;

    // Indices of turns whose payloads fall outside the window: walking
    // newest to oldest, the first `window` turns holding a live payload are
    // kept and every older turn with a live payload is returned.
    static std::vector<size_t> turns_to_prune(const std::vector<ConversationTurn>& turns, size_t window) {
        std::vector<size_t> prune;
        size_t kept = 0;
        for (size_t i = turns.size(); i-- > 0;) {
            if (!turns[i].has_live_image()) continue;
            if (kept < window) {
                ++kept;
            } else {
                prune.push_back(i);
            }
        }
        return prune;
    }

    // Pruned and re-uploaded images become one marker line each after the
    // turn text; live images travel as attachments.
    static std::vector<RenderedTurn> render(const std::vector<ConversationTurn>& turns) {
        std::vector<RenderedTurn> view;
        view.reserve(turns.size());

        for (const auto& turn : turns) {
            RenderedTurn rendered;
            rendered.role = turn.role;
            rendered.text = turn.text;

            for (const auto& slot : turn.images) {
                if (slot.live()) {
                    rendered.attachments.push_back({slot.reference, slot.mime_type, slot.payload});
                } else {
                    if (!rendered.text.empty()) rendered.text += "\n";
                    rendered.text += image_marker(slot.reference);
                }
            }
            for (const auto& reference : turn.repeated_references) {
                if (!rendered.text.empty()) rendered.text += "\n";
                rendered.text += image_marker(reference);
            }
            view.push_back(std::move(rendered));
        }
        return view;
    }
};

} // namespace receipt_assistant
