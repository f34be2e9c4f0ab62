// SPDX-License-Identifier: MIT

// lib/nostr_stream/base64.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "nostr_stream/payload.hpp"

namespace nostr_stream {

/// Standard (RFC 4648, padded) base64 encoding.
std::string Base64Encode(const Bytes& data);
std::string Base64Encode(std::string_view data);

/// Strict base64 decoding. Returns nullopt on characters outside the
/// alphabet, bad length or misplaced padding.
std::optional<Bytes> Base64Decode(std::string_view text);

}  // namespace nostr_stream
