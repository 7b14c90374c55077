#include "context/ContextCompactor.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace receipt_assistant {

ContextCompactor::ContextCompactor(std::shared_ptr<ReceiptStore> store,
                                   std::shared_ptr<BlobGateway> blobs,
                                   size_t retention_window)
    : store_(std::move(store)), blobs_(std::move(blobs)), retention_window_(retention_window) {
    if (retention_window_ == 0) throw std::invalid_argument("retention window must be at least 1");
}

Result<AppendResult> ContextCompactor::record_user_turn(Session& session, std::string text,
                                                        std::vector<InboundImage> images) {
    AppendResult result;
    for (size_t i = 0; i < images.size(); ++i) {
        if (images[i].data.empty()) {
            return Result<AppendResult>::failure(ErrorCode::InvalidArgument,
                                                 "image " + std::to_string(i) + " has no bytes");
        }
        result.references.push_back(content_reference(images[i].data));
    }

    ConversationTurn turn;
    turn.role = Role::User;
    turn.text = std::move(text);

    std::lock_guard<std::mutex> lock(session.mutex);
    for (size_t i = 0; i < images.size(); ++i) {
        const std::string& ref = result.references[i];
        bool seen_in_turn = std::any_of(turn.images.begin(), turn.images.end(),
                                        [&](const ImageSlot& slot) { return slot.reference == ref; });
        if (seen_in_turn || session.history.was_ever_uploaded(ref)) {
            result.repeated_references.push_back(ref);
            turn.repeated_references.push_back(ref);
            continue;
        }

        ImageSlot slot;
        slot.reference = ref;
        slot.mime_type = images[i].mime_type.empty() ? "application/octet-stream" : images[i].mime_type;
        slot.payload = std::make_shared<const Bytes>(std::move(images[i].data));
        slot.had_payload = true;
        turn.images.push_back(std::move(slot));
    }

    result.turn_index = session.history.append(std::move(turn));
    result.released_payloads = session.history.apply_retention(retention_window_);

    if (!result.repeated_references.empty()) {
        spdlog::info("🔁 Session {}: {} image(s) already uploaded earlier, kept as references",
                     session.id, result.repeated_references.size());
    }
    if (result.released_payloads > 0) {
        spdlog::info("🗜️ Session {}: released {} image payload(s) outside the last {} image turns",
                     session.id, result.released_payloads, retention_window_);
    }
    return Result<AppendResult>::success(std::move(result));
}

AppendResult ContextCompactor::record_assistant_turn(Session& session, std::string text) {
    ConversationTurn turn;
    turn.role = Role::Assistant;
    turn.text = std::move(text);

    AppendResult result;
    std::lock_guard<std::mutex> lock(session.mutex);
    result.turn_index = session.history.append(std::move(turn));
    return result;
}

std::vector<RenderedTurn> ContextCompactor::render(Session& session) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    return ContextManager::render(session.history.turns());
}

Result<ResolvedImage> ContextCompactor::resolve(Session& session, const std::string& reference) const {
    std::string mime_type;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (auto live = session.history.find_live_payload(reference)) {
            ResolvedImage image;
            image.reference = reference;
            image.data = live->data;
            image.mime_type = live->mime_type;
            image.source = ResolvedImage::Source::History;
            return Result<ResolvedImage>::success(std::move(image));
        }
        mime_type = session.history.mime_type_of(reference);
    }

    auto record = store_->get_by_id(reference);
    if (!record) {
        spdlog::error("❌ Image {} unavailable in session {}: not live in history and never stored as a receipt",
                      reference, session.id);
        return Result<ResolvedImage>::failure(ErrorCode::ImageUnavailable,
            "image " + reference + " is no longer in the conversation and was never stored as a receipt");
    }

    const std::string& uri = record.value()->image_uri;
    if (uri.empty()) {
        spdlog::error("❌ Receipt {} has no image uri", reference);
        return Result<ResolvedImage>::failure(ErrorCode::ImageUnavailable,
                                              "receipt " + reference + " has no stored image");
    }

    Bytes data;
    try {
        data = blobs_->get(uri);
    } catch (const GatewayError& e) {
        if (e.kind() == GatewayError::Kind::Timeout) {
            spdlog::warn("⏱️ Blob fetch timed out for {}: {}", uri, e.what());
            return Result<ResolvedImage>::failure(ErrorCode::GatewayTimeout, e.what());
        }
        spdlog::error("❌ Image {} unrecoverable from {}: {}", reference, uri, e.what());
        return Result<ResolvedImage>::failure(ErrorCode::ImageUnavailable, e.what());
    }

    ResolvedImage image;
    image.reference = reference;
    image.data = std::make_shared<const Bytes>(std::move(data));
    image.mime_type = mime_type.empty() ? "application/octet-stream" : mime_type;
    image.uri = uri;
    image.source = ResolvedImage::Source::ReceiptStore;
    return Result<ResolvedImage>::success(std::move(image));
}

bool ContextCompactor::was_ever_uploaded(Session& session, const std::string& reference) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    return session.history.was_ever_uploaded(reference);
}

} // namespace receipt_assistant
