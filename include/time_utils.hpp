#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace receipt_assistant {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

struct ParsedTimestamp {
    Timestamp instant;
    bool date_only = false;
};

// Accepts YYYY-MM-DD and YYYY-MM-DD[T ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM].
// A missing offset means UTC. Returns nullopt for anything else, including
// out-of-range calendar fields.
std::optional<ParsedTimestamp> parse_timestamp(const std::string& text);

// Always "YYYY-MM-DDTHH:MM:SSZ".
std::string format_timestamp(Timestamp ts);

Timestamp end_of_day(Timestamp ts);

} // namespace receipt_assistant
