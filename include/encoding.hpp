#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace receipt_assistant {

using Bytes = std::vector<uint8_t>;

// Lowercase hex SHA-256 of the raw bytes. This is the image reference and
// the receipt_id, so it must stay identical across processes.
std::string sha256_hex(const Bytes& data);

inline std::string content_reference(const Bytes& data) { return sha256_hex(data); }

// Throws std::invalid_argument on malformed input.
Bytes base64_decode(const std::string& encoded);
std::string base64_encode(const Bytes& data);

} // namespace receipt_assistant
