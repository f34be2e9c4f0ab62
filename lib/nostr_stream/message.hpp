// SPDX-License-Identifier: MIT

// lib/nostr_stream/message.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nostr_stream/error.hpp"

namespace nostr_stream {

/// Kind of the stream metadata message.
inline constexpr int kStreamMetadataKind = 173;
/// Kind of every stream chunk message.
inline constexpr int kStreamChunkKind = 20173;

using Tag = std::vector<std::string>;
using Tags = std::vector<Tag>;

/// Signed, content-addressed relay message (a Nostr event).
struct Message {
    std::string id;          ///< hex SHA-256 of the canonical serialization
    std::string pubkey;      ///< author, hex x-only key
    int64_t created_at = 0;  ///< unix seconds
    int kind = 0;
    Tags tags;
    std::string content;
    std::string sig;         ///< hex BIP-340 signature over id
};

/// Value of the first tag named @p name, if it has one.
std::optional<std::string_view> FindTag(const Message& msg, std::string_view name);

/// All values of tags named @p name, in order.
std::vector<std::string> FindTags(const Message& msg, std::string_view name);

/// `[0,pubkey,created_at,kind,tags,content]` serialized as compact JSON.
std::string CanonicalSerialization(const Message& msg);

/// hex SHA-256 of CanonicalSerialization().
std::string ComputeMessageId(const Message& msg);

/// True if the id matches the content and the signature verifies.
bool VerifyMessage(const Message& msg);

/// Wire JSON object form.
std::string ToJson(const Message& msg);
std::expected<Message, Error> MessageFromJson(std::string_view json);

/// Subscription filter: empty lists match everything.
struct Filter {
    std::vector<int> kinds;
    std::vector<std::string> authors;

    bool Matches(const Message& msg) const;
};

}  // namespace nostr_stream
