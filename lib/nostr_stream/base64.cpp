// SPDX-License-Identifier: MIT

#include "nostr_stream/base64.hpp"

#include <openssl/evp.h>

#include <climits>

namespace nostr_stream {

namespace {

bool IsBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string Encode(const unsigned char* data, size_t len) {
    if (len == 0) return {};
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                            static_cast<int>(len));
    out.resize(static_cast<size_t>(n));
    return out;
}

}  // namespace

std::string Base64Encode(const Bytes& data) {
    return Encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string Base64Encode(std::string_view data) {
    return Encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::optional<Bytes> Base64Decode(std::string_view text) {
    if (text.empty()) return Bytes{};
    if (text.size() % 4 != 0 || text.size() > INT_MAX) return std::nullopt;

    // EVP_DecodeBlock tolerates whitespace and counts padding as data,
    // so the alphabet and padding placement are checked here.
    size_t padding = 0;
    if (text.back() == '=') {
        padding = text[text.size() - 2] == '=' ? 2 : 1;
    }
    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!IsBase64Char(text[i])) return std::nullopt;
    }

    Bytes out(text.size() / 4 * 3);
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) return std::nullopt;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

}  // namespace nostr_stream
