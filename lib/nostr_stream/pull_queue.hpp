// SPDX-License-Identifier: MIT

// lib/nostr_stream/pull_queue.hpp
#pragma once

#include <deque>
#include <expected>
#include <functional>
#include <optional>
#include <utility>

#include "nostr_stream/error.hpp"

namespace nostr_stream {

/// Single-producer/single-consumer channel with pull semantics.
///
/// A Pull() is satisfied immediately from the buffer, or parked as a
/// waiter and matched FIFO against the next Push(). The result is a value,
/// nullopt once the queue is finished and drained, or an error.
///
/// Terminal transitions:
/// - Finish(): buffered values are still delivered, then nullopt.
/// - Fail(): sticky; the buffer is dropped and every pending and later
///   Pull() gets the error.
/// - Close(): consumer side shutdown; buffer dropped, waiters and later
///   pulls get nullopt, no error.
///
/// Only the first terminal transition has an effect. Callbacks run inline
/// in the call that satisfies them. Not thread-safe.
template <typename T>
class PullQueue {
public:
    using Result = std::expected<std::optional<T>, Error>;
    using Callback = std::function<void(Result)>;

    void Pull(Callback cb) {
        if (error_) {
            cb(std::unexpected(*error_));
            return;
        }
        if (!values_.empty()) {
            T value = std::move(values_.front());
            values_.pop_front();
            cb(Result{std::in_place, std::move(value)});
            return;
        }
        if (finished_) {
            cb(Result{std::nullopt});
            return;
        }
        waiters_.push_back(std::move(cb));
    }

    void Push(T value) {
        if (IsTerminal()) return;
        if (!waiters_.empty()) {
            Callback waiter = std::move(waiters_.front());
            waiters_.pop_front();
            waiter(Result{std::in_place, std::move(value)});
            return;
        }
        values_.push_back(std::move(value));
    }

    void Finish() {
        if (IsTerminal()) return;
        finished_ = true;
        // Waiters only exist while the buffer is empty
        ResolveWaiters();
    }

    void Fail(Error error) {
        if (IsTerminal()) return;
        error_ = std::move(error);
        values_.clear();
        auto waiters = std::exchange(waiters_, {});
        for (auto& waiter : waiters) {
            waiter(std::unexpected(*error_));
        }
    }

    void Close() {
        if (IsTerminal()) return;
        finished_ = true;
        values_.clear();
        ResolveWaiters();
    }

    bool IsTerminal() const { return finished_ || error_.has_value(); }
    bool HasError() const { return error_.has_value(); }
    size_t Buffered() const { return values_.size(); }
    size_t Waiting() const { return waiters_.size(); }

private:
    void ResolveWaiters() {
        auto waiters = std::exchange(waiters_, {});
        for (auto& waiter : waiters) {
            waiter(Result{std::nullopt});
        }
    }

    std::deque<T> values_;
    std::deque<Callback> waiters_;
    std::optional<Error> error_;
    bool finished_ = false;
};

}  // namespace nostr_stream
