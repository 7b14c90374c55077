#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "blob_gateway.hpp"
#include "context/ContextCompactor.hpp"
#include "errors.hpp"
#include "receipt_store.hpp"
#include "tools/ToolRegistry.hpp"

namespace receipt_assistant {

struct StoreReceiptArgs {
    std::string image_reference;
    std::string store_name;
    Timestamp transaction_time{};
    double total_amount = 0.0;
    std::vector<LineItem> purchased_items;
    std::string currency;
};

struct TextSearchArgs {
    std::string query_text;
    int limit = 5;
};

// The agent-facing receipt operations. Arguments arrive as loosely typed
// JSON and are validated into the structs above before anything reaches the
// store. Holds no state of its own.
class ReceiptTools {
public:
    static constexpr double kUnboundedAmount = -1.0;
    // Upper bound on search_receipts_by_text's limit; larger values are
    // InvalidArgument rather than silently clamped.
    static constexpr int kMaxSearchLimit = 10000;

    ReceiptTools(std::shared_ptr<ReceiptStore> store,
                 std::shared_ptr<ContextCompactor> compactor,
                 std::shared_ptr<BlobGateway> blobs,
                 int default_search_limit = 5);

    // --- argument validation ---
    static Result<StoreReceiptArgs> parse_store_args(const nlohmann::json& args);
    static Result<MetadataQuery> parse_range_args(const nlohmann::json& args);
    Result<TextSearchArgs> parse_text_args(const nlohmann::json& args) const;
    static Result<std::string> parse_reference_arg(const nlohmann::json& args);

    // Accepts a bare reference or one wrapped as "[IMAGE-ID <ref>]".
    static std::string normalize_reference(const std::string& raw);

    // --- typed operations ---
    Result<ReceiptPtr> store_receipt(Session& session, const StoreReceiptArgs& args);
    Result<std::vector<ReceiptPtr>> search_receipts_by_range(const MetadataQuery& query) const;
    Result<std::vector<SimilarityHit>> search_receipts_by_text(const TextSearchArgs& args) const;
    Result<ReceiptPtr> get_receipt(const std::string& reference) const;

    // --- JSON envelopes, as registered tools ---
    nlohmann::json store_receipt_tool(Session& session, const nlohmann::json& args);
    nlohmann::json search_by_range_tool(const nlohmann::json& args) const;
    nlohmann::json search_by_text_tool(const nlohmann::json& args) const;
    nlohmann::json get_receipt_tool(const nlohmann::json& args) const;

    void register_all(ToolRegistry& registry);

private:
    std::shared_ptr<ReceiptStore> store_;
    std::shared_ptr<ContextCompactor> compactor_;
    std::shared_ptr<BlobGateway> blobs_;
    int default_search_limit_;
};

} // namespace receipt_assistant
