#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace conduit::mediator {

// Raised when a cancellation signal fires before or during a handler.
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("The operation was cancelled") {}
};

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};

} // namespace detail

// Read-only view of a cancellation signal. A default-constructed token can
// never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool can_be_cancelled() const { return state_ != nullptr; }
    bool is_cancellation_requested() const;
    void throw_if_cancellation_requested() const;

    // Sleep up to `timeout`, waking early on cancellation.
    // Returns true if cancellation was requested.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    bool is_cancellation_requested() const;

    // Idempotent; wakes every waiter.
    void cancel();

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace conduit::mediator
