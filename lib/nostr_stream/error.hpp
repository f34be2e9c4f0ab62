// SPDX-License-Identifier: MIT

// lib/nostr_stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace nostr_stream {

/// Error codes for all writer, reader and strategy operations.
enum class ErrorCode {
    // Configuration
    InvalidMetadata,       ///< Metadata is missing a required field
    UnsupportedVersion,    ///< Protocol version other than "1"
    KeyMismatch,           ///< Private key does not derive the stated public key

    // State
    InvalidState,          ///< Method called after the stream finished or failed

    // Compression
    CompressionSizeLimitExceeded,  ///< Part does not fit into the current compressed batch
    CompressionFailed,     ///< Compressor rejected the input
    DecompressionFailed,   ///< Chunk payload could not be decompressed

    // Crypto
    InvalidKey,            ///< Key is malformed or not on the curve
    EncryptionFailed,      ///< Payload could not be encrypted
    DecryptionFailed,      ///< Payload could not be decrypted or authenticated
    SigningFailed,         ///< Message could not be signed

    // Protocol
    DecodeFailed,          ///< Chunk content is not valid base64/text
    ParseError,            ///< Error chunk or wire JSON is malformed
    UnsupportedMethod,     ///< Compression or encryption method not supported

    // Transport
    RelayFailure,          ///< No relay accepted a chunk
    PublishFailed,         ///< Transport failed while publishing a chunk

    // Limits
    MaxChunksExceeded,     ///< Reader received more chunks than allowed
    MaxSizeExceeded,       ///< Reader decoded more data than allowed
    TtlExceeded,           ///< No chunk arrived within the stall timeout

    // Remote
    RemoteError,           ///< Sender terminated the stream with an error chunk
};

/// Error payload delivered to completion callbacks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    std::string remote_code = {};  ///< Sender's code for RemoteError, empty otherwise
};

/// Return a short category string for an error code (e.g. "config", "crypto").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidMetadata:
        case ErrorCode::UnsupportedVersion:
        case ErrorCode::KeyMismatch:
            return "config";
        case ErrorCode::InvalidState:
            return "state";
        case ErrorCode::CompressionSizeLimitExceeded:
        case ErrorCode::CompressionFailed:
        case ErrorCode::DecompressionFailed:
            return "compression";
        case ErrorCode::InvalidKey:
        case ErrorCode::EncryptionFailed:
        case ErrorCode::DecryptionFailed:
        case ErrorCode::SigningFailed:
            return "crypto";
        case ErrorCode::DecodeFailed:
        case ErrorCode::ParseError:
        case ErrorCode::UnsupportedMethod:
            return "protocol";
        case ErrorCode::RelayFailure:
        case ErrorCode::PublishFailed:
            return "transport";
        case ErrorCode::MaxChunksExceeded:
        case ErrorCode::MaxSizeExceeded:
        case ErrorCode::TtlExceeded:
            return "limit";
        case ErrorCode::RemoteError:
            return "remote";
    }
    return "unknown";
}

/// Stable wire/programmatic code string for an error code.
///
/// These strings are what a sender puts into an error chunk and what
/// callers branch on, so they must never change.
constexpr std::string_view error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidMetadata: return "invalid_metadata";
        case ErrorCode::UnsupportedVersion: return "unsupported_version";
        case ErrorCode::KeyMismatch: return "key_mismatch";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::CompressionSizeLimitExceeded: return "compression_size_limit_exceeded";
        case ErrorCode::CompressionFailed: return "compression_failed";
        case ErrorCode::DecompressionFailed: return "decompression_failed";
        case ErrorCode::InvalidKey: return "invalid_key";
        case ErrorCode::EncryptionFailed: return "encryption_failed";
        case ErrorCode::DecryptionFailed: return "decryption_failed";
        case ErrorCode::SigningFailed: return "signing_failed";
        case ErrorCode::DecodeFailed: return "decode_failed";
        case ErrorCode::ParseError: return "parse_error";
        case ErrorCode::UnsupportedMethod: return "unsupported_method";
        case ErrorCode::RelayFailure: return "RELAY_FAILURE";
        case ErrorCode::PublishFailed: return "FAILED_TO_PUBLISH";
        case ErrorCode::MaxChunksExceeded: return "max_chunks_exceeded";
        case ErrorCode::MaxSizeExceeded: return "max_size_exceeded";
        case ErrorCode::TtlExceeded: return "ttl_exceeded";
        case ErrorCode::RemoteError: return "remote_error";
    }
    return "unknown";
}

/// Code string of a concrete error; remote errors report the sender's code.
inline std::string error_code_string(const Error& e) {
    if (e.code == ErrorCode::RemoteError) return e.remote_code;
    return std::string(error_code_string(e.code));
}

}  // namespace nostr_stream
