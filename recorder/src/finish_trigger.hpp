#pragma once

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>

#include "key_event_source.hpp"

/*
    The external "finish" trigger the termination watcher waits on.
*/
class FinishTrigger {
    public:
        virtual ~FinishTrigger() = default;

        // Returns true once the trigger has fired. Stays fired.
        virtual bool wait_for(std::chrono::milliseconds timeout) = 0;
};

/*
    Fires on the down transition of a finish key, or when `interrupt_flag`
    (raised by a signal handler or the quit key) becomes zero.
*/
class KeyFinishTrigger : public FinishTrigger {
    private:
        std::mutex mtx_;
        std::condition_variable cv_;
        bool fired_;
        const volatile sig_atomic_t* keep_running_;
        std::unique_ptr<KeySubscription> subscription_;

        bool interrupted_() const {
            return keep_running_ != nullptr && *keep_running_ == 0;
        }

    public:
        KeyFinishTrigger(
            KeyEventSource& source,
            const std::string& finish_key,
            const volatile sig_atomic_t* keep_running = nullptr
        );

        bool wait_for(std::chrono::milliseconds timeout) override;
};
