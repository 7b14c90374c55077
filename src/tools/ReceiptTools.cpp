#include "tools/ReceiptTools.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <spdlog/spdlog.h>

namespace receipt_assistant {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Numbers may arrive as JSON numbers or numeric strings.
std::optional<double> read_number(const json& v) {
    if (v.is_number()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        return d;
    }
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size() || !std::isfinite(d)) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

template <typename T>
Result<T> invalid(const std::string& message) {
    return Result<T>::failure(ErrorCode::InvalidArgument, message);
}

Result<Timestamp> read_time(const json& args, const char* key, bool end_of_range) {
    if (!args.contains(key) || !args[key].is_string()) {
        return invalid<Timestamp>(std::string(key) + " must be an ISO-8601 timestamp string");
    }
    auto parsed = parse_timestamp(args[key].get<std::string>());
    if (!parsed) {
        return invalid<Timestamp>(std::string(key) + " is not a valid timestamp: '" +
                                  args[key].get<std::string>() + "'");
    }
    if (end_of_range && parsed->date_only) return Result<Timestamp>::success(end_of_day(parsed->instant));
    return Result<Timestamp>::success(parsed->instant);
}

// -1 and null mean unbounded; any other negative value is rejected.
Result<std::optional<double>> read_amount_bound(const json& args, const char* key) {
    using Bound = std::optional<double>;
    if (!args.contains(key) || args[key].is_null()) return Result<Bound>::success(std::nullopt);

    auto value = read_number(args[key]);
    if (!value) return invalid<Bound>(std::string(key) + " must be a number");
    if (*value == ReceiptTools::kUnboundedAmount) return Result<Bound>::success(std::nullopt);
    if (*value < 0) return invalid<Bound>(std::string(key) + " must be non-negative or -1 for unbounded");
    return Result<Bound>::success(*value);
}

json records_to_json(const std::vector<ReceiptPtr>& records) {
    json arr = json::array();
    for (const auto& r : records) arr.push_back(r->to_public_json());
    return arr;
}

} // namespace

ReceiptTools::ReceiptTools(std::shared_ptr<ReceiptStore> store,
                           std::shared_ptr<ContextCompactor> compactor,
                           std::shared_ptr<BlobGateway> blobs,
                           int default_search_limit)
    : store_(std::move(store)),
      compactor_(std::move(compactor)),
      blobs_(std::move(blobs)),
      default_search_limit_(default_search_limit) {}

std::string ReceiptTools::normalize_reference(const std::string& raw) {
    std::string ref = trim(raw);
    const std::string prefix = "[IMAGE-ID ";
    if (ref.size() > prefix.size() && ref.compare(0, prefix.size(), prefix) == 0 && ref.back() == ']') {
        ref = trim(ref.substr(prefix.size(), ref.size() - prefix.size() - 1));
    }
    std::transform(ref.begin(), ref.end(), ref.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ref;
}

Result<std::string> ReceiptTools::parse_reference_arg(const json& args) {
    if (!args.is_object()) return invalid<std::string>("arguments must be a JSON object");
    if (!args.contains("image_reference") || !args["image_reference"].is_string()) {
        return invalid<std::string>("image_reference must be a string");
    }
    std::string ref = normalize_reference(args["image_reference"].get<std::string>());
    if (ref.empty()) return invalid<std::string>("image_reference must not be empty");
    return Result<std::string>::success(ref);
}

Result<StoreReceiptArgs> ReceiptTools::parse_store_args(const json& args) {
    auto ref = parse_reference_arg(args);
    if (!ref) return Result<StoreReceiptArgs>::failure(ref.error());

    StoreReceiptArgs out;
    out.image_reference = ref.value();

    if (!args.contains("store_name") || !args["store_name"].is_string()) {
        return invalid<StoreReceiptArgs>("store_name must be a string");
    }
    out.store_name = trim(args["store_name"].get<std::string>());
    if (out.store_name.empty()) return invalid<StoreReceiptArgs>("store_name must not be empty");

    auto ts = read_time(args, "transaction_time", false);
    if (!ts) return Result<StoreReceiptArgs>::failure(ts.error());
    out.transaction_time = ts.value();

    if (!args.contains("total_amount")) return invalid<StoreReceiptArgs>("total_amount is required");
    auto amount = read_number(args["total_amount"]);
    if (!amount) return invalid<StoreReceiptArgs>("total_amount must be a number");
    if (*amount < 0) return invalid<StoreReceiptArgs>("total_amount must not be negative");
    out.total_amount = *amount;

    if (!args.contains("currency") || !args["currency"].is_string()) {
        return invalid<StoreReceiptArgs>("currency must be a string");
    }
    std::string currency = trim(args["currency"].get<std::string>());
    if (currency.size() != 3 ||
        !std::all_of(currency.begin(), currency.end(), [](unsigned char c) { return std::isalpha(c); })) {
        return invalid<StoreReceiptArgs>("currency must be a three-letter code, got '" + currency + "'");
    }
    std::transform(currency.begin(), currency.end(), currency.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    out.currency = currency;

    if (args.contains("purchased_items") && !args["purchased_items"].is_null()) {
        const auto& items = args["purchased_items"];
        if (!items.is_array()) return invalid<StoreReceiptArgs>("purchased_items must be an array");
        for (size_t i = 0; i < items.size(); ++i) {
            const auto& item = items[i];
            std::string where = "purchased_items[" + std::to_string(i) + "]";
            if (!item.is_object()) return invalid<StoreReceiptArgs>(where + " must be an object");
            if (!item.contains("name") || !item["name"].is_string() ||
                trim(item["name"].get<std::string>()).empty()) {
                return invalid<StoreReceiptArgs>(where + ".name must be a non-empty string");
            }
            if (!item.contains("price")) return invalid<StoreReceiptArgs>(where + ".price is required");
            auto price = read_number(item["price"]);
            if (!price || *price < 0) {
                return invalid<StoreReceiptArgs>(where + ".price must be a non-negative number");
            }
            out.purchased_items.push_back({trim(item["name"].get<std::string>()), *price});
        }
    }
    return Result<StoreReceiptArgs>::success(std::move(out));
}

Result<MetadataQuery> ReceiptTools::parse_range_args(const json& args) {
    if (!args.is_object()) return invalid<MetadataQuery>("arguments must be a JSON object");

    MetadataQuery query;
    auto start = read_time(args, "start_time", false);
    if (!start) return Result<MetadataQuery>::failure(start.error());
    auto end = read_time(args, "end_time", true);
    if (!end) return Result<MetadataQuery>::failure(end.error());
    query.start_time = start.value();
    query.end_time = end.value();

    auto min_amount = read_amount_bound(args, "min_amount");
    if (!min_amount) return Result<MetadataQuery>::failure(min_amount.error());
    auto max_amount = read_amount_bound(args, "max_amount");
    if (!max_amount) return Result<MetadataQuery>::failure(max_amount.error());
    query.min_amount = min_amount.value();
    query.max_amount = max_amount.value();

    if (query.start_time > query.end_time) {
        return Result<MetadataQuery>::failure(ErrorCode::InvalidRange, "start_time is after end_time");
    }
    if (query.min_amount && query.max_amount && *query.min_amount > *query.max_amount) {
        return Result<MetadataQuery>::failure(ErrorCode::InvalidRange, "min_amount is greater than max_amount");
    }
    return Result<MetadataQuery>::success(query);
}

Result<TextSearchArgs> ReceiptTools::parse_text_args(const json& args) const {
    if (!args.is_object()) return invalid<TextSearchArgs>("arguments must be a JSON object");

    TextSearchArgs out;
    if (!args.contains("query_text") || !args["query_text"].is_string()) {
        return invalid<TextSearchArgs>("query_text must be a string");
    }
    out.query_text = trim(args["query_text"].get<std::string>());
    if (out.query_text.empty()) return invalid<TextSearchArgs>("query_text must not be empty");

    out.limit = default_search_limit_;
    if (args.contains("limit") && !args["limit"].is_null()) {
        auto limit = read_number(args["limit"]);
        if (!limit || *limit != std::floor(*limit) || *limit < 1 || *limit > kMaxSearchLimit) {
            return invalid<TextSearchArgs>("limit must be an integer between 1 and " +
                                           std::to_string(kMaxSearchLimit));
        }
        out.limit = static_cast<int>(*limit);
    }
    return Result<TextSearchArgs>::success(std::move(out));
}

Result<ReceiptPtr> ReceiptTools::store_receipt(Session& session, const StoreReceiptArgs& args) {
    if (store_->contains(args.image_reference)) {
        return Result<ReceiptPtr>::failure(ErrorCode::DuplicateReceipt,
                                           "receipt " + args.image_reference + " already exists");
    }

    auto image = compactor_->resolve(session, args.image_reference);
    if (!image) return Result<ReceiptPtr>::failure(image.error());

    std::string uri;
    try {
        uri = blobs_->put(*image.value().data, image.value().mime_type);
    } catch (const GatewayError& e) {
        spdlog::warn("⚠️ Blob upload failed for {}: {}", args.image_reference, e.what());
        ErrorCode code = e.kind() == GatewayError::Kind::Timeout ? ErrorCode::GatewayTimeout
                                                                 : ErrorCode::StorageFailure;
        return Result<ReceiptPtr>::failure(code, e.what());
    }

    ReceiptRecord record;
    record.receipt_id = args.image_reference;
    record.store_name = args.store_name;
    record.transaction_time = args.transaction_time;
    record.total_amount = args.total_amount;
    record.currency = args.currency;
    record.purchased_items = args.purchased_items;
    record.image_uri = uri;
    return store_->store(std::move(record));
}

Result<std::vector<ReceiptPtr>> ReceiptTools::search_receipts_by_range(const MetadataQuery& query) const {
    return store_->search_by_metadata(query);
}

Result<std::vector<SimilarityHit>> ReceiptTools::search_receipts_by_text(const TextSearchArgs& args) const {
    return store_->search_by_similarity(args.query_text, args.limit);
}

Result<ReceiptPtr> ReceiptTools::get_receipt(const std::string& reference) const {
    return store_->get_by_id(normalize_reference(reference));
}

json ReceiptTools::store_receipt_tool(Session& session, const json& args) {
    auto parsed = parse_store_args(args);
    if (!parsed) return error_envelope(parsed.error());

    auto stored = store_receipt(session, parsed.value());
    if (!stored) return error_envelope(stored.error());
    return ok_envelope(stored.value()->to_public_json());
}

json ReceiptTools::search_by_range_tool(const json& args) const {
    auto query = parse_range_args(args);
    if (!query) return error_envelope(query.error());

    auto found = search_receipts_by_range(query.value());
    if (!found) return error_envelope(found.error());
    return ok_envelope(records_to_json(found.value()));
}

json ReceiptTools::search_by_text_tool(const json& args) const {
    auto parsed = parse_text_args(args);
    if (!parsed) return error_envelope(parsed.error());

    auto hits = search_receipts_by_text(parsed.value());
    if (!hits) return error_envelope(hits.error());

    json arr = json::array();
    for (const auto& hit : hits.value()) {
        json j = hit.record->to_public_json();
        j["distance"] = hit.distance;
        arr.push_back(std::move(j));
    }
    return ok_envelope(std::move(arr));
}

json ReceiptTools::get_receipt_tool(const json& args) const {
    auto ref = parse_reference_arg(args);
    if (!ref) return error_envelope(ref.error());

    auto found = get_receipt(ref.value());
    if (!found) return error_envelope(found.error());
    return ok_envelope(found.value()->to_public_json());
}

void ReceiptTools::register_all(ToolRegistry& registry) {
    registry.register_tool(std::make_unique<GenericTool>(
        "store_receipt",
        "Persist a receipt extracted from an uploaded image. Rejects a receipt whose image was already stored.",
        json{
            {"type", "object"},
            {"properties", {
                {"image_reference", {{"type", "string"}, {"description", "Reference from [IMAGE-ID <ref>] or the attachment"}}},
                {"store_name", {{"type", "string"}}},
                {"transaction_time", {{"type", "string"}, {"description", "ISO-8601, e.g. 2024-03-01T10:00:00Z"}}},
                {"total_amount", {{"type", "number"}, {"minimum", 0}}},
                {"purchased_items", {{"type", "array"}, {"items", {
                    {"type", "object"},
                    {"properties", {{"name", {{"type", "string"}}}, {"price", {{"type", "number"}, {"minimum", 0}}}}},
                    {"required", {"name", "price"}}
                }}}},
                {"currency", {{"type", "string"}, {"description", "ISO-4217 code"}}}
            }},
            {"required", {"image_reference", "store_name", "transaction_time", "total_amount", "currency"}}
        },
        [this](Session& session, const json& args) { return store_receipt_tool(session, args); }));

    registry.register_tool(std::make_unique<GenericTool>(
        "search_receipts_by_range",
        "List receipts whose transaction time and total amount fall inside inclusive ranges. Use -1 for an unbounded amount.",
        json{
            {"type", "object"},
            {"properties", {
                {"start_time", {{"type", "string"}}},
                {"end_time", {{"type", "string"}}},
                {"min_amount", {{"type", "number"}, {"default", kUnboundedAmount}}},
                {"max_amount", {{"type", "number"}, {"default", kUnboundedAmount}}}
            }},
            {"required", {"start_time", "end_time"}}
        },
        [this](Session&, const json& args) { return search_by_range_tool(args); }));

    registry.register_tool(std::make_unique<GenericTool>(
        "search_receipts_by_text",
        "Find the receipts most similar to a free-text description, nearest first.",
        json{
            {"type", "object"},
            {"properties", {
                {"query_text", {{"type", "string"}}},
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", kMaxSearchLimit},
                           {"default", default_search_limit_}}}
            }},
            {"required", {"query_text"}}
        },
        [this](Session&, const json& args) { return search_by_text_tool(args); }));

    registry.register_tool(std::make_unique<GenericTool>(
        "get_receipt",
        "Fetch the stored receipt for an image reference.",
        json{
            {"type", "object"},
            {"properties", {{"image_reference", {{"type", "string"}}}}},
            {"required", {"image_reference"}}
        },
        [this](Session&, const json& args) { return get_receipt_tool(args); }));
}

} // namespace receipt_assistant
