// SPDX-License-Identifier: MIT

// lib/nostr_stream/loopback_relay.hpp
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "nostr_stream/event_loop.hpp"
#include "nostr_stream/relay.hpp"

namespace nostr_stream {

/// In-memory relay set driven by an IEventLoop.
///
/// Each URL names an independent relay that is created on first use.
/// A relay accepts a message only if it is online and the message
/// verifies; accepted messages are stored and delivered to every matching
/// subscription that includes that relay, so a message published to N
/// relays reaches a subscriber N times. Subscribing replays the stored
/// messages first.
///
/// All completions run from Defer() on the event loop, never inline.
/// Single-threaded: use from the event-loop thread only.
class LoopbackRelay : public IRelayTransport {
public:
    explicit LoopbackRelay(IEventLoop& loop);
    ~LoopbackRelay() override;

    LoopbackRelay(const LoopbackRelay&) = delete;
    LoopbackRelay& operator=(const LoopbackRelay&) = delete;

    void Publish(const Message& msg, const std::vector<std::string>& relays,
                 PublishCallback callback) override;

    std::unique_ptr<ISubscription> Subscribe(const Filter& filter,
                                             const std::vector<std::string>& relays,
                                             MessageCallback on_message) override;

    /// Take a relay offline (rejects publishes, delivers nothing) or back online.
    void SetOnline(const std::string& url, bool online);

    /// Fail every following Publish() at the transport level.
    void SetFailPublishes(bool fail);

    /// Messages stored by @p url, in acceptance order.
    std::vector<Message> Stored(const std::string& url) const;

    /// Number of open subscriptions.
    size_t SubscriptionCount() const;

private:
    struct Relay {
        bool online = true;
        std::vector<Message> messages;
    };

    struct Subscriber {
        Filter filter;
        std::vector<std::string> relays;
        MessageCallback on_message;
    };

    struct State {
        std::map<std::string, Relay> relays;
        std::map<uint64_t, Subscriber> subscribers;
        uint64_t next_subscriber_id = 1;
        bool fail_publishes = false;
    };

    class Subscription;

    void Deliver(uint64_t subscriber_id, const Message& msg);

    IEventLoop& loop_;
    std::shared_ptr<State> state_;
};

}  // namespace nostr_stream
