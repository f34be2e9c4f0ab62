// SPDX-License-Identifier: MIT

#include "nostr_stream/epoll_event_loop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace nostr_stream {

namespace {

[[noreturn]] void ThrowErrno(const char* what) {
    throw std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
}

void AddReadable(int epoll_fd, int fd) {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0) {
        ThrowErrno("epoll_ctl ADD");
    }
}

void Drain(int fd) {
    uint64_t val = 0;
    [[maybe_unused]] ssize_t n = read(fd, &val, sizeof(val));
}

}  // namespace

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        ThrowErrno("epoll_create1");
    }

    try {
        wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) ThrowErrno("eventfd");
        AddReadable(epoll_fd_, wake_fd_);

        // steady_clock is CLOCK_MONOTONIC on Linux, so deadlines can be
        // handed to the timerfd as absolute times.
        timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (timer_fd_ < 0) ThrowErrno("timerfd_create");
        AddReadable(epoll_fd_, timer_fd_);
    } catch (...) {
        if (timer_fd_ >= 0) close(timer_fd_);
        if (wake_fd_ >= 0) close(wake_fd_);
        close(epoll_fd_);
        throw;
    }
}

EpollEventLoop::~EpollEventLoop() {
    timers_.clear();
    deferred_callbacks_.clear();

    if (timer_fd_ >= 0) close(timer_fd_);
    if (wake_fd_ >= 0) close(wake_fd_);
    if (epoll_fd_ >= 0) close(epoll_fd_);
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    // Wake up the event loop if called from another thread
    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    auto deadline = Now() + delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool earliest = timers_.empty() || deadline < timers_.begin()->first;
        // upper_bound keeps equal deadlines in scheduling order
        timers_.emplace_hint(timers_.upper_bound(deadline), deadline, std::move(fn));
        if (earliest) {
            ArmTimerFd();
        }
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

IEventLoop::Clock::time_point EpollEventLoop::Now() const {
    return Clock::now();
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EpollEventLoop::ArmTimerFd() {
    itimerspec ts{};
    if (!timers_.empty()) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            timers_.begin()->first.time_since_epoch()).count();
        if (ns <= 0) ns = 1;  // zero would disarm
        ts.it_value.tv_sec = ns / 1'000'000'000;
        ts.it_value.tv_nsec = ns % 1'000'000'000;
    }
    if (timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &ts, nullptr) < 0) {
        ThrowErrno("timerfd_settime");
    }
}

void EpollEventLoop::Poll(int timeout_ms) {
    // Set the thread id for IsInEventLoopThread()
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    // Deferred work queued by the callbacks above must not wait for timeout
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!deferred_callbacks_.empty()) timeout_ms = 0;
    }

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        ThrowErrno("epoll_wait");
    }

    for (int i = 0; i < nfds; ++i) {
        if (events[i].data.fd == wake_fd_) {
            Drain(wake_fd_);
        } else if (events[i].data.fd == timer_fd_) {
            Drain(timer_fd_);
        }
    }

    // Timers are checked against the clock rather than the timerfd event,
    // so a deadline that passed during a long callback is never missed.
    ProcessExpiredTimers();
    ProcessDeferredCallbacks();
}

void EpollEventLoop::Run() {
    // Only run if we're in Idle state (not already Stopped)
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;
    }
    while (state_.load() == State::Running) {
        Poll(100);  // 100ms timeout to check state_ periodically
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();  // Interrupt epoll_wait so Run() exits immediately
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessExpiredTimers() {
    std::vector<TimerCallback> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Now();
        auto end = timers_.upper_bound(now);
        for (auto it = timers_.begin(); it != end; ++it) {
            expired.push_back(std::move(it->second));
        }
        timers_.erase(timers_.begin(), end);
        ArmTimerFd();
    }

    // Execute callbacks outside the lock
    for (auto& cb : expired) {
        if (cb) {
            cb();
        }
    }
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

// EventLoop pimpl

struct EventLoop::Impl : EpollEventLoop {};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) { impl_->Poll(timeout_ms); }

void EventLoop::Run() { impl_->Run(); }

void EventLoop::Stop() { impl_->Stop(); }

EventLoop::operator IEventLoop&() { return *impl_; }

EventLoop::operator const IEventLoop&() const { return *impl_; }

}  // namespace nostr_stream
