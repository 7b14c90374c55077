#pragma once
#include <filesystem>
#include <string>
#include "encoding.hpp"

namespace receipt_assistant {

// Object storage for raw image bytes. Implementations throw GatewayError
// when the backing store cannot be reached or the uri is unknown.
class BlobGateway {
public:
    virtual ~BlobGateway() = default;
    virtual std::string put(const Bytes& data, const std::string& mime_type) = 0;
    virtual Bytes get(const std::string& uri) = 0;
};

// Content-addressed files under a root directory, exposed as file:// uris.
// Putting identical bytes twice returns the same uri.
class FileBlobGateway : public BlobGateway {
public:
    explicit FileBlobGateway(const std::string& root_dir);

    std::string put(const Bytes& data, const std::string& mime_type) override;
    Bytes get(const std::string& uri) override;

    static std::string extension_for(const std::string& mime_type);

private:
    std::filesystem::path root_;
};

} // namespace receipt_assistant
