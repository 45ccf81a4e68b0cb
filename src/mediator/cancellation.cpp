#include "mediator/cancellation.hpp"
#include <thread>

namespace conduit::mediator {

bool CancellationToken::is_cancellation_requested() const {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

void CancellationToken::throw_if_cancellation_requested() const {
    if (is_cancellation_requested()) {
        throw OperationCancelled();
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this]() {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationSource::is_cancellation_requested() const {
    return state_->cancelled.load(std::memory_order_acquire);
}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
}

} // namespace conduit::mediator
