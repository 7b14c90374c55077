#include "encoding.hpp"
#include <openssl/evp.h>
#include <array>
#include <stdexcept>

namespace receipt_assistant {

std::string sha256_hex(const Bytes& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

Bytes base64_decode(const std::string& encoded) {
    std::string s;
    s.reserve(encoded.size());
    for (unsigned char c : encoded) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        s.push_back(static_cast<char>(c));
    }
    if (s.empty()) return {};
    if (s.size() % 4 != 0) throw std::invalid_argument("invalid base64 length");

    Bytes out((s.size() / 4) * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0) throw std::invalid_argument("invalid base64 payload");
    out.resize(static_cast<size_t>(n));

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t pad = 0;
    if (s.back() == '=') pad++;
    if (s.size() >= 2 && s[s.size() - 2] == '=') pad++;
    if (pad > out.size()) throw std::invalid_argument("invalid base64 padding");
    out.resize(out.size() - pad);
    return out;
}

std::string base64_encode(const Bytes& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                            static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

} // namespace receipt_assistant
