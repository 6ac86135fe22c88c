#include "finish_trigger.hpp"

// Upper bound on how long a signal-handler interrupt goes unnoticed.
constexpr auto INTERRUPT_POLL_INTERVAL = std::chrono::milliseconds(50);

KeyFinishTrigger::KeyFinishTrigger(
    KeyEventSource& source,
    const std::string& finish_key,
    const volatile sig_atomic_t* keep_running
) : fired_(false), keep_running_(keep_running) {
    subscription_ = std::make_unique<KeySubscription>(
        source, finish_key,
        [this](const KeyTransition& transition) {
            if (!transition.down) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mtx_);
                fired_ = true;
            }
            cv_.notify_all();
        });
}

bool KeyFinishTrigger::wait_for(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mtx_);
    while (!fired_) {
        if (interrupted_()) {
            fired_ = true;
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        // Signal handlers can't notify, so wake up periodically to check.
        auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (slice > INTERRUPT_POLL_INTERVAL) {
            slice = INTERRUPT_POLL_INTERVAL;
        }
        cv_.wait_for(lock, slice);
    }
    return fired_;
}
