#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace receipt_assistant {

struct LineItem {
    std::string name;
    double price = 0.0;
};

struct ReceiptRecord {
    std::string receipt_id;        // sha256 of the image bytes
    std::string store_name;
    Timestamp transaction_time{};
    double total_amount = 0.0;
    std::string currency;
    std::vector<LineItem> purchased_items;
    std::vector<float> embedding;
    std::string image_uri;

    // Full persisted form, embedding included.
    nlohmann::json to_json() const;
    // Tool-facing form; the embedding is never sent back to the agent.
    nlohmann::json to_public_json() const;
    // Throws nlohmann::json::exception or std::invalid_argument on bad input.
    static ReceiptRecord from_json(const nlohmann::json& j);
};

// Deterministic text used as embedding input: store name, items, amount.
std::string canonical_text(const ReceiptRecord& record);

} // namespace receipt_assistant
