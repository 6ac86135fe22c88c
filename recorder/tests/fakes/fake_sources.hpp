#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "finish_trigger.hpp"
#include "frame_source.hpp"
#include "key_event_source.hpp"
#include "recording_types.hpp"

// Emits a small frame every `interval` until stopped, or fails after `fail_after` frames.
class FakeFrameSource : public FrameSource {
    public:
        std::chrono::milliseconds interval{2};
        int fail_after = -1;        // -1 = never
        bool fail_start = false;
        int end_after = -1;         // -1 = never reach end of stream

        std::atomic<int> start_calls{0};
        std::atomic<int> stop_calls{0};

        bool start() override {
            start_calls++;
            return !fail_start;
        }

        void stop() override { stop_calls++; }

        FrameStatus next(ScreenFrame& frame, std::chrono::milliseconds timeout) override {
            if (fail_after >= 0 && emitted_ >= static_cast<uint64_t>(fail_after)) {
                return FrameStatus::ERROR;
            }
            if (end_after >= 0 && emitted_ >= static_cast<uint64_t>(end_after)) {
                std::this_thread::sleep_for(timeout);
                return FrameStatus::END_OF_STREAM;
            }
            std::this_thread::sleep_for(interval < timeout ? interval : timeout);
            frame.sequence_number = ++emitted_;
            frame.timestamp_us = now_us();
            frame.width = 2;
            frame.height = 1;
            frame.channels = 3;
            frame.image_data.assign(6, static_cast<uint8_t>(emitted_.load()));
            return FrameStatus::FRAME;
        }

        std::string last_error() const override {
            return fail_start ? "fake start failure" : "fake frame failure";
        }

        uint64_t emitted() const { return emitted_; }

    private:
        std::atomic<uint64_t> emitted_{0};
};

// Delivers transitions on the calling thread, like a hook thread would.
class FakeKeyboard : public KeyEventSource {
    public:
        SubscriptionId subscribe(const std::string& key, KeyCallback callback) override {
            std::lock_guard<std::mutex> lock(mtx_);
            SubscriptionId id = next_id_++;
            subscribers_[id] = {key, std::move(callback)};
            return id;
        }

        void unsubscribe(SubscriptionId id) override {
            std::lock_guard<std::mutex> lock(mtx_);
            subscribers_.erase(id);
        }

        bool failed() const override { return failed_.load(); }
        std::string last_error() const override { return "fake keyboard failure"; }

        void press(const std::string& key, int64_t timestamp_us) { emit(key, timestamp_us, true); }
        void release(const std::string& key, int64_t timestamp_us) { emit(key, timestamp_us, false); }

        void emit(const std::string& key, int64_t timestamp_us, bool down) {
            std::lock_guard<std::mutex> lock(mtx_);
            KeyTransition transition{key, timestamp_us, down};
            for (auto& entry : subscribers_) {
                if (entry.second.first == key) {
                    entry.second.second(transition);
                }
            }
        }

        void fail() { failed_ = true; }

        size_t subscriber_count() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return subscribers_.size();
        }

    private:
        mutable std::mutex mtx_;
        std::map<SubscriptionId, std::pair<std::string, KeyCallback>> subscribers_;
        SubscriptionId next_id_ = 1;
        std::atomic<bool> failed_{false};
};

// Fires when the test says so.
class ManualTrigger : public FinishTrigger {
    public:
        void fire() {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                fired_ = true;
            }
            cv_.notify_all();
        }

        bool wait_for(std::chrono::milliseconds timeout) override {
            std::unique_lock<std::mutex> lock(mtx_);
            return cv_.wait_for(lock, timeout, [this] { return fired_; });
        }

    private:
        std::mutex mtx_;
        std::condition_variable cv_;
        bool fired_ = false;
};
