// SPDX-License-Identifier: MIT

// lib/nostr_stream/encryption.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "nostr_stream/error.hpp"
#include "nostr_stream/keys.hpp"
#include "nostr_stream/payload.hpp"

namespace nostr_stream {

inline constexpr std::string_view kEncryptionNone = "none";
inline constexpr std::string_view kEncryptionNip44 = "nip44";

/// Encryption strategy. Callers always pass one explicitly.
class IEncryption {
public:
    virtual ~IEncryption() = default;

    virtual bool Supports(std::string_view method) const = 0;

    /// Largest input one Encrypt() call accepts for @p method, if limited.
    virtual std::optional<size_t> MaxChunkSize(std::string_view method) const = 0;

    /// Encrypt @p data for the receiver. Bytes are base64-encoded first;
    /// the result is always text.
    virtual std::expected<std::string, Error> Encrypt(const Payload& data,
                                                      std::string_view method,
                                                      const SecretKey& sender_key,
                                                      std::string_view receiver_public_key) = 0;

    /// Inverse of Encrypt().
    /// @param binary  Return Bytes (base64-decoding the plaintext) instead of text
    virtual std::expected<Payload, Error> Decrypt(std::string_view data,
                                                  std::string_view method, bool binary,
                                                  const SecretKey& receiver_key,
                                                  std::string_view sender_public_key) = 0;
};

/// Built-in strategy supporting "none" and "nip44" (NIP-44 v2).
class DefaultEncryption : public IEncryption {
public:
    /// NIP-44 plaintext limit, reduced for the base64 expansion of binary input.
    static constexpr size_t kNip44MaxChunkSize = 65535 / 4 * 3;

    bool Supports(std::string_view method) const override;
    std::optional<size_t> MaxChunkSize(std::string_view method) const override;

    std::expected<std::string, Error> Encrypt(const Payload& data, std::string_view method,
                                              const SecretKey& sender_key,
                                              std::string_view receiver_public_key) override;

    std::expected<Payload, Error> Decrypt(std::string_view data, std::string_view method,
                                          bool binary, const SecretKey& receiver_key,
                                          std::string_view sender_public_key) override;
};

}  // namespace nostr_stream
