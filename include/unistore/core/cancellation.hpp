#pragma once

#include "unistore/core/errors.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace unistore {

// Read side of a cooperative cancellation signal.
// A default-constructed token is never cancelled and has no deadline.
// Tokens are cheap to copy; all copies observe the same source.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const {
        for (const State* s = state_.get(); s; s = s->parent.get()) {
            if (s->cancelled.load(std::memory_order_acquire)) return true;
        }
        return false;
    }

    bool deadline_exceeded() const {
        auto now = std::chrono::steady_clock::now();
        for (const State* s = state_.get(); s; s = s->parent.get()) {
            if (s->deadline && now >= *s->deadline) return true;
        }
        return false;
    }

    // True when work should stop, for either reason.
    bool stop_requested() const { return is_cancelled() || deadline_exceeded(); }

    // Throws StorageError(Cancelled) or StorageError(Timeout).
    void throw_if_stopped(const std::string& operation) const {
        if (is_cancelled()) {
            throw StorageError(ErrorKind::Cancelled, operation + ": cancelled");
        }
        if (deadline_exceeded()) {
            throw StorageError(ErrorKind::Timeout, operation + ": deadline exceeded");
        }
    }

    // Token that stops when this one does, or once `timeout` has elapsed.
    CancellationToken with_timeout(std::chrono::steady_clock::duration timeout) const {
        auto state = std::make_shared<State>();
        state->deadline = std::chrono::steady_clock::now() + timeout;
        state->parent = state_;
        return CancellationToken(std::move(state));
    }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<std::chrono::steady_clock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// Write side: owned by whoever may cancel the operation.
class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<CancellationToken::State>()) {}

    // Operations observing this source fail with Timeout once the deadline passes.
    explicit CancellationSource(std::chrono::steady_clock::duration timeout)
        : CancellationSource() {
        state_->deadline = std::chrono::steady_clock::now() + timeout;
    }

    void cancel() { state_->cancelled.store(true, std::memory_order_release); }

    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace unistore
