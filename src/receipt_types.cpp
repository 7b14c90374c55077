#include "receipt_types.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace receipt_assistant {

using json = nlohmann::json;

namespace {

json items_to_json(const std::vector<LineItem>& items) {
    json arr = json::array();
    for (const auto& item : items) {
        arr.push_back({{"name", item.name}, {"price", item.price}});
    }
    return arr;
}

} // namespace

json ReceiptRecord::to_json() const {
    json j = to_public_json();
    j["embedding"] = embedding;
    return j;
}

json ReceiptRecord::to_public_json() const {
    return json{
        {"receipt_id", receipt_id},
        {"store_name", store_name},
        {"transaction_time", format_timestamp(transaction_time)},
        {"total_amount", total_amount},
        {"currency", currency},
        {"purchased_items", items_to_json(purchased_items)},
        {"image_uri", image_uri}
    };
}

ReceiptRecord ReceiptRecord::from_json(const json& j) {
    ReceiptRecord record;
    record.receipt_id = j.at("receipt_id").get<std::string>();
    record.store_name = j.at("store_name").get<std::string>();

    auto ts = parse_timestamp(j.at("transaction_time").get<std::string>());
    if (!ts) throw std::invalid_argument("bad transaction_time for " + record.receipt_id);
    record.transaction_time = ts->instant;

    record.total_amount = j.at("total_amount").get<double>();
    record.currency = j.value("currency", "");
    if (j.contains("purchased_items")) {
        for (const auto& item : j["purchased_items"]) {
            record.purchased_items.push_back({item.at("name").get<std::string>(),
                                              item.at("price").get<double>()});
        }
    }
    if (j.contains("embedding")) record.embedding = j["embedding"].get<std::vector<float>>();
    record.image_uri = j.value("image_uri", "");
    return record;
}

std::string canonical_text(const ReceiptRecord& record) {
    std::string text = "Store: " + record.store_name + "\n";
    text += "Items:";
    if (record.purchased_items.empty()) {
        text += " none";
    } else {
        for (size_t i = 0; i < record.purchased_items.size(); ++i) {
            const auto& item = record.purchased_items[i];
            text += fmt::format("{} {} ({:.2f})", i == 0 ? "" : ",", item.name, item.price);
        }
    }
    text += fmt::format("\nTotal: {:.2f} {}", record.total_amount, record.currency);
    return text;
}

} // namespace receipt_assistant
