// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "nostr_stream/event_loop.hpp"

namespace nostr_stream {

/// One-shot or periodic timer built on IEventLoop::Schedule().
///
/// Works with any IEventLoop implementation. Safe to destroy while armed;
/// pending callbacks are silently discarded. Every Start() opens a new
/// generation, so a callback scheduled by an earlier arming never fires
/// after Stop() or a re-arm.
///
/// @code
/// Timer watchdog(loop);
/// watchdog.OnTimer([] { check_stall(); });
/// watchdog.Start(500, 500);  // first check after 500ms, then every 500ms
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    /// @param loop  Event loop that drives this timer
    explicit Timer(IEventLoop& loop)
        : loop_(loop), alive_(std::make_shared<bool>(true)) {}

    ~Timer() {
        *alive_ = false;
        armed_ = false;
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked on each timer tick.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm the timer, cancelling any previous arming.
    /// @param delay        Initial delay before first tick
    /// @param interval     Repeat interval (0 = one-shot)
    void Start(std::chrono::milliseconds delay,
               std::chrono::milliseconds interval = std::chrono::milliseconds{0}) {
        ++generation_;
        interval_ = interval;
        armed_ = true;
        ScheduleNext(delay);
    }

    /// Disarm the timer. No further callbacks will fire.
    void Stop() {
        ++generation_;
        armed_ = false;
        interval_ = std::chrono::milliseconds{0};
    }

    /// Return true if the timer is armed.
    bool IsArmed() const { return armed_; }

private:
    void ScheduleNext(std::chrono::milliseconds delay) {
        // Capture shared_ptr by value - outlives Timer if needed
        std::shared_ptr<bool> alive = alive_;
        Timer* self = this;
        uint64_t generation = generation_;
        loop_.Schedule(delay, [alive, self, generation]() {
            if (*alive && self->generation_ == generation) {
                self->Fire();
            }
        });
    }

    void Fire() {
        if (!armed_) return;

        uint64_t generation = generation_;
        if (interval_.count() == 0) {
            armed_ = false;
        }

        if (callback_) {
            callback_();
        }

        // The callback may have stopped or re-armed the timer
        if (armed_ && generation_ == generation && interval_.count() > 0) {
            ScheduleNext(interval_);
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    std::chrono::milliseconds interval_{0};
    bool armed_ = false;
    uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_;
};

}  // namespace nostr_stream
