// SPDX-License-Identifier: MIT

// lib/nostr_stream/relay.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nostr_stream/error.hpp"
#include "nostr_stream/message.hpp"

namespace nostr_stream {

/// Open subscription. Destroying the handle closes it.
class ISubscription {
public:
    virtual ~ISubscription() = default;

    /// Stop delivery. No on_message callback runs after Close() returns.
    virtual void Close() = 0;
};

/// Publish/subscribe transport over a set of relays.
///
/// Relays give no ordering and no delivery guarantee beyond eventual
/// delivery; the same message may arrive once per relay.
///
/// Completion contract: callbacks never run inside the call that
/// registered them. They are invoked later on the transport's event loop.
class IRelayTransport {
public:
    /// Relays that accepted the message, or a transport-level failure.
    using PublishCallback = std::function<void(std::expected<std::vector<std::string>, Error>)>;
    using MessageCallback = std::function<void(const Message&)>;

    virtual ~IRelayTransport() = default;

    /// Publish @p msg to every relay in @p relays independently.
    virtual void Publish(const Message& msg, const std::vector<std::string>& relays,
                         PublishCallback callback) = 0;

    /// Deliver every stored and future message matching @p filter.
    virtual std::unique_ptr<ISubscription> Subscribe(const Filter& filter,
                                                     const std::vector<std::string>& relays,
                                                     MessageCallback on_message) = 0;
};

}  // namespace nostr_stream
