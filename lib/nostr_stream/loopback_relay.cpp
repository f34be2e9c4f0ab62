// SPDX-License-Identifier: MIT

#include "nostr_stream/loopback_relay.hpp"

#include <algorithm>

#include "nostr_stream/log.hpp"

namespace nostr_stream {

class LoopbackRelay::Subscription : public ISubscription {
public:
    Subscription(std::weak_ptr<State> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    ~Subscription() override { Close(); }

    void Close() override {
        if (auto state = state_.lock()) {
            state->subscribers.erase(id_);
        }
        state_.reset();
    }

private:
    std::weak_ptr<State> state_;
    uint64_t id_;
};

LoopbackRelay::LoopbackRelay(IEventLoop& loop)
    : loop_(loop), state_(std::make_shared<State>()) {}

LoopbackRelay::~LoopbackRelay() = default;

void LoopbackRelay::Publish(const Message& msg, const std::vector<std::string>& relays,
                            PublishCallback callback) {
    std::weak_ptr<State> weak_state = state_;
    loop_.Defer([this, weak_state, msg, relays, callback = std::move(callback)]() {
        auto state = weak_state.lock();
        if (!state) return;

        if (state->fail_publishes) {
            callback(std::unexpected(Error{ErrorCode::PublishFailed,
                                           "Transport failure publishing " + msg.id}));
            return;
        }

        bool valid = VerifyMessage(msg);
        std::vector<std::string> accepted;
        for (const auto& url : relays) {
            Relay& relay = state->relays[url];
            if (!relay.online) {
                Logger()->debug("loopback: relay {} offline, rejecting {}", url, msg.id);
                continue;
            }
            if (!valid) {
                Logger()->warn("loopback: relay {} rejected invalid message {}", url, msg.id);
                continue;
            }
            accepted.push_back(url);

            bool duplicate = std::any_of(relay.messages.begin(), relay.messages.end(),
                                         [&](const Message& m) { return m.id == msg.id; });
            if (duplicate) continue;
            relay.messages.push_back(msg);

            for (const auto& [id, sub] : state->subscribers) {
                bool listening = std::find(sub.relays.begin(), sub.relays.end(), url) !=
                                 sub.relays.end();
                if (listening && sub.filter.Matches(msg)) {
                    Deliver(id, msg);
                }
            }
        }
        callback(std::move(accepted));
    });
}

std::unique_ptr<ISubscription> LoopbackRelay::Subscribe(const Filter& filter,
                                                        const std::vector<std::string>& relays,
                                                        MessageCallback on_message) {
    uint64_t id = state_->next_subscriber_id++;
    state_->subscribers.emplace(id, Subscriber{filter, relays, std::move(on_message)});

    // Replay what the relays already hold
    for (const auto& url : relays) {
        const Relay& relay = state_->relays[url];
        if (!relay.online) continue;
        for (const auto& msg : relay.messages) {
            if (filter.Matches(msg)) Deliver(id, msg);
        }
    }
    return std::make_unique<Subscription>(state_, id);
}

void LoopbackRelay::Deliver(uint64_t subscriber_id, const Message& msg) {
    std::weak_ptr<State> weak_state = state_;
    loop_.Defer([weak_state, subscriber_id, msg]() {
        auto state = weak_state.lock();
        if (!state) return;
        auto it = state->subscribers.find(subscriber_id);
        if (it == state->subscribers.end()) return;
        // Copy: the callback may close its own subscription
        MessageCallback on_message = it->second.on_message;
        on_message(msg);
    });
}

void LoopbackRelay::SetOnline(const std::string& url, bool online) {
    state_->relays[url].online = online;
}

void LoopbackRelay::SetFailPublishes(bool fail) {
    state_->fail_publishes = fail;
}

std::vector<Message> LoopbackRelay::Stored(const std::string& url) const {
    auto it = state_->relays.find(url);
    if (it == state_->relays.end()) return {};
    return it->second.messages;
}

size_t LoopbackRelay::SubscriptionCount() const {
    return state_->subscribers.size();
}

}  // namespace nostr_stream
