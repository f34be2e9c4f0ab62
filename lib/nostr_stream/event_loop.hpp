// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace nostr_stream {

/// Event loop interface driving writers, readers and transports.
///
/// Implement this to integrate nostr-stream with an existing event loop
/// (libuv, asio, etc.). The built-in EventLoop class wraps an epoll
/// implementation behind this interface.
///
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using TimerCallback = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Schedule a callback for the next event loop iteration.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Schedule a callback after a delay.
    /// @param delay  Minimum time before callback fires
    /// @param fn     Callback to invoke
    virtual void Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    /// Current time as seen by this loop. Every time-based rule of the
    /// stream protocol reads the clock through here.
    virtual Clock::time_point Now() const = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

/// Type-erased event loop using epoll internally.
///
/// Provides implicit conversion to IEventLoop& so it can be passed
/// directly to writer and reader factories:
/// @code
/// EventLoop loop;
/// auto reader = StreamReader::Create(loop, relay, metadata, compression, encryption);
/// loop.Run();
/// @endcode
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// Dispatch ready timers and deferred callbacks once.
    /// @param timeout_ms  Max wait for the next event (-1 = infinite)
    void Poll(int timeout_ms = -1);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the event loop to stop after the current iteration.
    void Stop();

    /// Implicit conversion to IEventLoop&.
    operator IEventLoop&();
    /// @copydoc operator IEventLoop&()
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace nostr_stream
