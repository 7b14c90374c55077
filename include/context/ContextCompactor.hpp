#pragma once
#include <memory>
#include <string>
#include <vector>
#include "blob_gateway.hpp"
#include "context/ContextManager.hpp"
#include "context/SessionRegistry.hpp"
#include "errors.hpp"
#include "receipt_store.hpp"

namespace receipt_assistant {

struct AppendResult {
    size_t turn_index = 0;
    std::vector<std::string> references;            // one per image, in order
    std::vector<std::string> repeated_references;   // seen earlier; no new slot
    size_t released_payloads = 0;
};

struct ResolvedImage {
    enum class Source { History, ReceiptStore };

    std::string reference;
    std::shared_ptr<const Bytes> data;
    std::string mime_type;
    std::string uri;     // set when resolved through the store
    Source source = Source::History;
};

// Records turns into a session's history, keeps at most `retention_window`
// image-bearing turns live, and resolves references from live history or,
// failing that, from stored receipts.
class ContextCompactor {
public:
    ContextCompactor(std::shared_ptr<ReceiptStore> store,
                     std::shared_ptr<BlobGateway> blobs,
                     size_t retention_window = ContextManager::kDefaultRetentionWindow);

    Result<AppendResult> record_user_turn(Session& session, std::string text,
                                          std::vector<InboundImage> images);
    AppendResult record_assistant_turn(Session& session, std::string text);

    std::vector<RenderedTurn> render(Session& session) const;

    Result<ResolvedImage> resolve(Session& session, const std::string& reference) const;

    bool was_ever_uploaded(Session& session, const std::string& reference) const;

    size_t retention_window() const { return retention_window_; }

private:
    std::shared_ptr<ReceiptStore> store_;
    std::shared_ptr<BlobGateway> blobs_;
    size_t retention_window_;
};

} // namespace receipt_assistant
