#include "blob_gateway.hpp"
#include "errors.hpp"
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>
#include <spdlog/spdlog.h>

namespace receipt_assistant {

namespace fs = std::filesystem;

namespace {
const std::string kFileScheme = "file://";
}

FileBlobGateway::FileBlobGateway(const std::string& root_dir)
    : root_(fs::absolute(root_dir).lexically_normal()) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw GatewayError(GatewayError::Kind::Unavailable,
                           "cannot create blob directory " + root_.string() + ": " + ec.message());
    }
}

std::string FileBlobGateway::extension_for(const std::string& mime_type) {
    if (mime_type == "image/jpeg" || mime_type == "image/jpg") return ".jpg";
    if (mime_type == "image/png") return ".png";
    if (mime_type == "image/webp") return ".webp";
    if (mime_type == "image/gif") return ".gif";
    if (mime_type == "application/pdf") return ".pdf";
    return ".bin";
}

std::string FileBlobGateway::put(const Bytes& data, const std::string& mime_type) {
    fs::path target = root_ / (sha256_hex(data) + extension_for(mime_type));
    std::string uri = kFileScheme + target.string();

    if (fs::exists(target)) return uri;

    // Temp name then rename: the content-addressed name never holds a partial blob.
    fs::path tmp = target;
    tmp += ".tmp" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw GatewayError(GatewayError::Kind::Unavailable, "failed writing blob " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw GatewayError(GatewayError::Kind::Unavailable, "failed publishing blob " + target.string());
    }

    spdlog::debug("Blob stored: {} ({} bytes)", uri, data.size());
    return uri;
}

Bytes FileBlobGateway::get(const std::string& uri) {
    if (uri.compare(0, kFileScheme.size(), kFileScheme) != 0) {
        throw GatewayError(GatewayError::Kind::Unavailable, "unsupported blob uri: " + uri);
    }
    fs::path path = fs::path(uri.substr(kFileScheme.size())).lexically_normal();

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw GatewayError(GatewayError::Kind::Unavailable, "blob not found: " + uri);
    }
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace receipt_assistant
