// SPDX-License-Identifier: MIT

// lib/nostr_stream/nip44.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "nostr_stream/error.hpp"
#include "nostr_stream/keys.hpp"

namespace nostr_stream::nip44 {

// NIP-44 version 2 payload encryption:
//   conversation_key = HKDF-extract(salt="nip44-v2", ECDH x coordinate)
//   chacha_key | chacha_nonce | hmac_key = HKDF-expand(conversation_key, nonce, 76)
//   payload = base64(0x02 | nonce | ChaCha20(pad(plaintext)) | HMAC(nonce | ciphertext))

inline constexpr std::uint8_t kVersion = 2;
inline constexpr size_t kMinPlaintextSize = 1;
inline constexpr size_t kMaxPlaintextSize = 65535;

/// Shared key of (secret key, peer public key); symmetric in the two parties.
std::expected<Hash32, Error> GetConversationKey(const SecretKey& key,
                                                std::string_view peer_public_key);

/// Padded length for a plaintext of @p unpadded_len bytes.
size_t CalcPaddedLen(size_t unpadded_len);

std::expected<std::string, Error> Encrypt(std::string_view plaintext,
                                          const Hash32& conversation_key,
                                          const Hash32& nonce);

/// Encrypt with a random nonce.
std::expected<std::string, Error> Encrypt(std::string_view plaintext,
                                          const Hash32& conversation_key);

std::expected<std::string, Error> Decrypt(std::string_view payload,
                                          const Hash32& conversation_key);

}  // namespace nostr_stream::nip44
