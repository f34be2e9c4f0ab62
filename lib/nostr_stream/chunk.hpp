// SPDX-License-Identifier: MIT

// lib/nostr_stream/chunk.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "nostr_stream/compression.hpp"
#include "nostr_stream/encryption.hpp"
#include "nostr_stream/error.hpp"
#include "nostr_stream/message.hpp"
#include "nostr_stream/metadata.hpp"
#include "nostr_stream/payload.hpp"

namespace nostr_stream {

/// Chunk status tag; done and error are terminal.
enum class ChunkStatus { Active, Done, Error };

constexpr std::string_view ToString(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Active: return "active";
        case ChunkStatus::Done: return "done";
        case ChunkStatus::Error: return "error";
    }
    return "unknown";
}

std::optional<ChunkStatus> ParseChunkStatus(std::string_view s);

/// Tag-carried chunk fields.
struct ChunkHeader {
    uint64_t index = 0;   ///< Sender's sequence number; diagnostic only
    ChunkStatus status = ChunkStatus::Active;
    std::string prev;     ///< Id of the preceding chunk; empty if absent
};

/// Tags `i`, `status` and, unless @p prev is empty, `prev`.
Tags MakeChunkTags(uint64_t index, ChunkStatus status, std::string_view prev);

/// Read the header tags of a chunk message.
///
/// Returns nullopt when `i` is missing or not a non-negative integer, or
/// `status` is missing or unknown. A missing `prev` is reported as empty;
/// whether that is acceptable depends on the index and status.
std::optional<ChunkHeader> ParseChunkHeader(const Message& msg);

/// Turn a finished compressor batch into message content:
/// encrypt if the stream is encrypted, otherwise carry text as is and
/// bytes as base64 (binary or compressed streams) or UTF-8 text. An empty
/// batch of an encrypted stream becomes empty content.
std::expected<std::string, Error> EncodeChunkContent(const Payload& batch,
                                                     const StreamMetadata& meta,
                                                     IEncryption& encryption,
                                                     const SecretKey& sender_key);

/// Inverse of EncodeChunkContent() followed by decompression.
///
/// Stage failures map to DecodeFailed, DecryptionFailed and
/// DecompressionFailed. The result is Bytes for binary streams and text
/// otherwise. A decompressed result over @p max_size fails with
/// MaxSizeExceeded.
std::expected<Payload, Error> DecodeChunkContent(std::string_view content,
                                                 const StreamMetadata& meta,
                                                 ICompression& compression,
                                                 IEncryption& encryption,
                                                 std::optional<size_t> max_size = std::nullopt);

/// `{"code":...,"message":...}` content of an error chunk.
std::string EncodeErrorContent(std::string_view code, std::string_view message);

/// Parse error chunk content into a RemoteError carrying the sender's code,
/// or return a ParseError if the content is not that object.
std::expected<Error, Error> ParseErrorContent(std::string_view content);

}  // namespace nostr_stream
