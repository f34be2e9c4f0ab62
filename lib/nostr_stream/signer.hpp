// SPDX-License-Identifier: MIT

// lib/nostr_stream/signer.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

#include "nostr_stream/error.hpp"
#include "nostr_stream/keys.hpp"
#include "nostr_stream/message.hpp"

namespace nostr_stream {

/// Signing identity: turns (kind, content, tags, key) into a uniquely
/// identified, verifiable message.
class ISigner {
public:
    virtual ~ISigner() = default;

    virtual std::expected<Message, Error> Sign(int kind, std::string content, Tags tags,
                                               const SecretKey& key) = 0;
};

/// BIP-340 Schnorr signer producing Nostr events.
///
/// created_at comes from the injected clock (unix seconds), defaulting to
/// the system clock. Auxiliary signing randomness comes from the OpenSSL
/// RNG.
class SchnorrSigner : public ISigner {
public:
    using UnixClock = std::function<int64_t()>;

    SchnorrSigner();
    explicit SchnorrSigner(UnixClock clock) : clock_(std::move(clock)) {}

    std::expected<Message, Error> Sign(int kind, std::string content, Tags tags,
                                       const SecretKey& key) override;

private:
    UnixClock clock_;
};

}  // namespace nostr_stream
