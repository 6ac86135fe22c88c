#include "cancellation_signal.hpp"

bool CancellationSignal::set() {
    bool transitioned = false;
    {
        // Flip under the lock so a waiter can't miss the notify between its
        // predicate check and its wait.
        std::lock_guard<std::mutex> lock(mtx_);
        transitioned = !is_set_.exchange(true, std::memory_order_acq_rel);
    }
    if (transitioned) {
        cv_.notify_all();
    }
    return transitioned;
}

void CancellationSignal::wait() const {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return is_set(); });
}

bool CancellationSignal::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [this] { return is_set(); });
}
