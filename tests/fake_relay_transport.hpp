// SPDX-License-Identifier: MIT

// tests/fake_relay_transport.hpp
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "nostr_stream/event_loop.hpp"
#include "nostr_stream/relay.hpp"

namespace nostr_stream::test {

/// Scriptable transport.
///
/// Publish() records the message. With auto-accept on (the default) every
/// relay accepts it on the next loop iteration; otherwise the publish stays
/// pending until the test settles it. Subscribe() records the filter and
/// Deliver() pushes messages to open subscriptions.
class FakeRelayTransport : public IRelayTransport {
public:
    struct PendingPublish {
        Message message;
        std::vector<std::string> relays;
        PublishCallback callback;
    };

    explicit FakeRelayTransport(IEventLoop& loop) : loop_(loop) {}

    void Publish(const Message& msg, const std::vector<std::string>& relays,
                 PublishCallback callback) override {
        published.push_back(msg);
        if (auto_accept_) {
            loop_.Defer([relays, callback = std::move(callback)]() { callback(relays); });
            return;
        }
        pending_.push_back(PendingPublish{msg, relays, std::move(callback)});
    }

    std::unique_ptr<ISubscription> Subscribe(const Filter& filter,
                                             const std::vector<std::string>& relays,
                                             MessageCallback on_message) override {
        ++subscribe_count;
        last_filter = filter;
        last_relays = relays;
        auto sub = std::make_shared<SubscriptionState>();
        sub->on_message = std::move(on_message);
        subscriptions_.push_back(sub);
        return std::make_unique<Handle>(sub);
    }

    void SetAutoAccept(bool on) { auto_accept_ = on; }

    size_t PendingCount() const { return pending_.size(); }

    /// Complete the oldest pending publish with @p result.
    void SettleNext(std::expected<std::vector<std::string>, Error> result) {
        PendingPublish p = std::move(pending_.front());
        pending_.pop_front();
        p.callback(std::move(result));
    }

    /// Accept every pending publish on all of its relays.
    void AcceptAll() {
        while (!pending_.empty()) {
            auto relays = pending_.front().relays;
            SettleNext(relays);
        }
    }

    /// Push @p msg to every open subscription.
    void Deliver(const Message& msg) {
        auto subs = subscriptions_;
        for (auto& sub : subs) {
            if (!sub->closed) sub->on_message(msg);
        }
    }

    size_t OpenSubscriptions() const {
        size_t n = 0;
        for (const auto& sub : subscriptions_) {
            if (!sub->closed) ++n;
        }
        return n;
    }

    std::vector<Message> published;
    int subscribe_count = 0;
    Filter last_filter;
    std::vector<std::string> last_relays;

private:
    struct SubscriptionState {
        MessageCallback on_message;
        bool closed = false;
    };

    class Handle : public ISubscription {
    public:
        explicit Handle(std::shared_ptr<SubscriptionState> state) : state_(std::move(state)) {}
        ~Handle() override { Close(); }
        void Close() override { state_->closed = true; }

    private:
        std::shared_ptr<SubscriptionState> state_;
    };

    IEventLoop& loop_;
    bool auto_accept_ = true;
    std::deque<PendingPublish> pending_;
    std::vector<std::shared_ptr<SubscriptionState>> subscriptions_;
};

}  // namespace nostr_stream::test
