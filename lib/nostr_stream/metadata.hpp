// SPDX-License-Identifier: MIT

// lib/nostr_stream/metadata.hpp
#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "nostr_stream/error.hpp"
#include "nostr_stream/keys.hpp"
#include "nostr_stream/message.hpp"
#include "nostr_stream/signer.hpp"

namespace nostr_stream {

/// The only protocol version this library speaks.
inline constexpr std::string_view kProtocolVersion = "1";

/// Immutable description of one stream, shared by writer and reader.
struct StreamMetadata {
    std::string stream_id;                ///< Sender public key (hex); author of every chunk
    std::vector<std::string> relays;      ///< Relay URLs chunks are published to
    std::optional<std::string> version;   ///< Absent means "1"
    bool binary = false;                  ///< Payload is bytes (true) or UTF-8 text
    std::string compression;              ///< e.g. "none", "zstd"; never empty
    std::string encryption;               ///< e.g. "none", "nip44"; never empty
    std::string receiver_public_key;      ///< Required when encrypted
    std::optional<SecretKey> receiver_private_key;  ///< Reader side only, when encrypted

    bool IsEncrypted() const { return encryption != "none"; }
};

/// Checks shared by both sides plus the writer's own requirements.
/// @throws std::invalid_argument describing the first violation
void ValidateForWriter(const StreamMetadata& meta);

/// Checks shared by both sides plus the receiver key pair check.
/// @throws std::invalid_argument describing the first violation
void ValidateForReader(const StreamMetadata& meta);

/// Signed kind-173 announcement of @p meta. The private key never travels.
std::expected<Message, Error> CreateMetadataMessage(const StreamMetadata& meta,
                                                    ISigner& signer,
                                                    const SecretKey& sender_key);

/// Inverse of CreateMetadataMessage(); stream_id is the message author.
std::expected<StreamMetadata, Error> ParseMetadataMessage(const Message& msg);

}  // namespace nostr_stream
