// SPDX-License-Identifier: MIT

// tests/manual_event_loop.hpp
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <utility>
#include <vector>

#include "nostr_stream/event_loop.hpp"

namespace nostr_stream::test {

/// Virtual-time event loop for deterministic tests.
///
/// Nothing runs until the test calls RunPending() or Advance(). Scheduled
/// callbacks fire in deadline order, equal deadlines in scheduling order,
/// and deferred work is drained after each of them.
class ManualEventLoop : public IEventLoop {
public:
    void Defer(std::function<void()> fn) override { deferred_.push_back(std::move(fn)); }

    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override {
        timers_.emplace(now_ + delay, std::move(fn));
    }

    Clock::time_point Now() const override { return now_; }

    bool IsInEventLoopThread() const override { return true; }

    /// Run deferred callbacks, including ones they defer, until none remain.
    size_t RunPending() {
        size_t count = 0;
        while (!deferred_.empty()) {
            auto batch = std::exchange(deferred_, {});
            for (auto& fn : batch) {
                fn();
                ++count;
            }
        }
        return count;
    }

    /// Move virtual time forward by @p delta, firing every timer that falls due.
    void Advance(std::chrono::milliseconds delta) {
        RunPending();
        auto target = now_ + delta;
        while (!timers_.empty() && timers_.begin()->first <= target) {
            auto it = timers_.begin();
            now_ = it->first;
            TimerCallback fn = std::move(it->second);
            timers_.erase(it);
            fn();
            RunPending();
        }
        now_ = target;
    }

    size_t PendingTimers() const { return timers_.size(); }
    size_t PendingDeferred() const { return deferred_.size(); }

private:
    Clock::time_point now_ = Clock::time_point{} + std::chrono::hours{1};
    std::vector<std::function<void()>> deferred_;
    std::multimap<Clock::time_point, TimerCallback> timers_;
};

}  // namespace nostr_stream::test
