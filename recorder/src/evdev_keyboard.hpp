#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "key_event_source.hpp"
#include "key_names.hpp"

/*
    Keyboard hook on Linux evdev devices (/dev/input/event*).
    One reader thread polls every opened device and delivers down/up
    transitions to subscribers. Auto-repeat events are not delivered.
    Needs read access to the device nodes (root or the `input` group).
*/
class EvdevKeyboard : public KeyEventSource {
private:
    struct Subscription {
        std::string key;
        KeyCallback callback;
    };

    std::vector<int> fds_;
    std::vector<std::string> device_paths_;
    std::unique_ptr<std::thread> reader_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> failed_;
    KeyStateFilter key_state_;  // reader thread only

    // Held while callbacks run, so unsubscribe() waits for an in-flight callback
    std::mutex subscribers_mtx_;
    std::map<SubscriptionId, Subscription> subscribers_;
    SubscriptionId next_id_;

    mutable std::mutex error_mtx_;
    std::string last_error_;

    void reader_thread_func_();
    void deliver_(int device, int code, bool down);
    void fail_(const std::string& message);

public:
    EvdevKeyboard();

    // Opens `device_paths`, or every keyboard-like device when empty.
    bool initialize(const std::vector<std::string>& device_paths = {});
    bool start();
    void stop();

    SubscriptionId subscribe(const std::string& key, KeyCallback callback) override;
    void unsubscribe(SubscriptionId id) override;
    bool failed() const override;
    std::string last_error() const override;

    const std::vector<std::string>& device_paths() const { return device_paths_; }

    ~EvdevKeyboard() override;
};

// Paths of /dev/input/event* devices that report letter keys, sorted.
std::vector<std::string> find_keyboard_devices();
