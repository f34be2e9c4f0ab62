// SPDX-License-Identifier: MIT

// lib/nostr_stream/keys.hpp
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nostr_stream/error.hpp"

namespace nostr_stream {

// secp256k1 keys as used by Nostr: 32-byte secret keys and x-only public
// keys exchanged as 64-character lowercase hex.

inline constexpr size_t kKeySize = 32;

using SecretKey = std::array<std::uint8_t, kKeySize>;
using Hash32 = std::array<std::uint8_t, 32>;
using Signature = std::array<std::uint8_t, 64>;

std::string HexEncode(std::span<const std::uint8_t> data);
std::optional<std::vector<std::uint8_t>> HexDecode(std::string_view hex);

/// Parse a 64-character hex secret key.
std::optional<SecretKey> SecretKeyFromHex(std::string_view hex);

/// Fresh random secret key in [1, n-1]. Throws std::runtime_error if the
/// OpenSSL RNG fails.
SecretKey GenerateSecretKey();

/// x-only public key (hex) of a secret key.
std::expected<std::string, Error> DerivePublicKey(const SecretKey& key);

Hash32 Sha256(std::string_view data);

/// BIP-340 Schnorr signature over a 32-byte message.
/// @param aux  Auxiliary randomness mixed into the nonce
std::expected<Signature, Error> SchnorrSign(const SecretKey& key, const Hash32& msg,
                                            const Hash32& aux);

/// BIP-340 verification against an x-only hex public key.
bool SchnorrVerify(std::string_view public_key, const Hash32& msg, const Signature& sig);

/// x coordinate of key * lift_x(public_key) (ECDH for NIP-44).
std::expected<Hash32, Error> SharedSecretX(const SecretKey& key, std::string_view public_key);

}  // namespace nostr_stream
