// SPDX-License-Identifier: MIT

// lib/nostr_stream/payload.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nostr_stream {

using Bytes = std::vector<std::byte>;

/// Stream data unit: UTF-8 text or raw bytes.
///
/// Which alternative is active follows StreamMetadata::binary on the
/// application side; inside the chunk pipeline compressed and decrypted
/// intermediates are always Bytes.
using Payload = std::variant<std::string, Bytes>;

inline bool IsBinary(const Payload& p) { return std::holds_alternative<Bytes>(p); }

/// Size in bytes (UTF-8 bytes for text).
inline size_t PayloadSize(const Payload& p) {
    return std::visit([](const auto& v) { return v.size(); }, p);
}

/// Empty payload of the requested kind.
inline Payload EmptyPayload(bool binary) {
    if (binary) return Bytes{};
    return std::string{};
}

inline Bytes ToBytes(std::string_view s) {
    const auto* p = reinterpret_cast<const std::byte*>(s.data());
    return Bytes(p, p + s.size());
}

inline std::string ToString(const Bytes& b) {
    return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

/// Raw bytes of either alternative.
inline Bytes PayloadBytes(const Payload& p) {
    if (const auto* s = std::get_if<std::string>(&p)) return ToBytes(*s);
    return std::get<Bytes>(p);
}

/// Split a payload into parts of at most @p max_part bytes.
///
/// Text is never split inside a UTF-8 sequence; a part may therefore be
/// up to three bytes shorter than @p max_part. A zero @p max_part returns
/// the payload unsplit. An empty payload yields no parts.
std::vector<Payload> SplitPayload(const Payload& data, size_t max_part);

/// Length of @p text without a trailing incomplete UTF-8 sequence, for
/// callers that receive text in arbitrary byte blocks.
size_t CompleteUtf8Prefix(std::string_view text);

}  // namespace nostr_stream
