// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "nostr_stream/event_loop.hpp"

namespace nostr_stream {

/// Epoll-based event loop for deferred callbacks and timer scheduling.
///
/// Two file descriptors are watched: an eventfd used to wake the loop from
/// other threads, and a single timerfd that is always armed for the
/// earliest pending deadline.  Scheduled callbacks live in an ordered
/// deadline table; callbacks with equal deadlines fire in scheduling order.
///
/// Thread safety: the loop itself runs on a single thread.  Defer(),
/// Schedule() and Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create the epoll instance, the wake eventfd and the timerfd.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    /// Schedule a one-shot callback after @p delay milliseconds.
    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// @return steady_clock::now().
    Clock::time_point Now() const override;

    /// @return True if the calling thread is the event-loop thread.
    bool IsInEventLoopThread() const override;

    /// Poll for events with the given timeout (milliseconds).  -1 blocks.
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// @return Number of scheduled callbacks that have not fired yet.
    size_t PendingTimers() const;

private:
    void ProcessDeferredCallbacks();
    void ProcessExpiredTimers();
    void ArmTimerFd();  // requires mutex_ held

    enum class State { Idle, Running, Stopped };

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    int timer_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    mutable std::mutex mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;
    std::multimap<Clock::time_point, TimerCallback> timers_;

    static constexpr int kMaxEvents = 8;
};

}  // namespace nostr_stream
