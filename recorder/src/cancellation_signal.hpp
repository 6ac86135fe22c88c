#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/*
    One-shot stop flag shared by the capture tasks.
    Goes from "unset" to "set" exactly once. Any number of threads may poll
    it or block on it. Setting it again is a no-op.
*/
class CancellationSignal {
    private:
        std::atomic<bool> is_set_{false};
        mutable std::mutex mtx_;
        mutable std::condition_variable cv_;

    public:
        CancellationSignal() = default;
        CancellationSignal(const CancellationSignal&) = delete;
        CancellationSignal& operator=(const CancellationSignal&) = delete;

        // Returns true only for the call that performed the transition.
        bool set();

        bool is_set() const {
            return is_set_.load(std::memory_order_acquire);
        }

        void wait() const;

        // Returns true if the signal is set when the wait ends.
        bool wait_for(std::chrono::milliseconds timeout) const;
};
