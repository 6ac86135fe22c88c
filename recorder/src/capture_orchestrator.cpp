#include "capture_orchestrator.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <utility>

#include "spsc_ring_buffer.hpp"

// How often the watcher re-checks the stop signal while waiting on the trigger.
constexpr auto WATCHER_SLICE = std::chrono::milliseconds(50);

namespace {

// Stops the frame source on every exit path of the frame task.
class FrameSourceGuard {
    private:
        FrameSource& source_;

    public:
        explicit FrameSourceGuard(FrameSource& source) : source_(source) {}
        ~FrameSourceGuard() { source_.stop(); }
        FrameSourceGuard(const FrameSourceGuard&) = delete;
        FrameSourceGuard& operator=(const FrameSourceGuard&) = delete;
};

void drain(SPSCRingBuffer<KeyEvent>& pending, std::vector<KeyEvent>& out) {
    KeyEvent event;
    while (pending.pop(event)) {
        out.push_back(std::move(event));
    }
}

}  // namespace

CaptureOrchestrator::CaptureOrchestrator(
    FrameSource& frame_source,
    KeyEventSource& key_source,
    FinishTrigger& finish_trigger,
    CaptureOptions options
) : frame_source_(frame_source), key_source_(key_source),
    finish_trigger_(finish_trigger), options_(std::move(options)) {}

std::vector<ScreenFrame> CaptureOrchestrator::capture_frames_(CaptureMonitorSummary& summary) {
    std::vector<ScreenFrame> frames;
    CaptureMonitor monitor(options_.target_fps, options_.live_out);

    if (!frame_source_.start()) {
        throw CaptureError("frame capture failed to start: " + frame_source_.last_error());
    }
    FrameSourceGuard guard(frame_source_);

    bool streaming = true;
    while (streaming && !stop_signal_.is_set()) {
        ScreenFrame frame;
        switch (frame_source_.next(frame, options_.poll_interval)) {
            case FrameStatus::FRAME:
                if (!frames.empty() && frame.timestamp_us < frames.back().timestamp_us) {
                    std::cerr << "[frames] Out-of-order frame seq:" << frame.sequence_number
                              << " ts:" << frame.timestamp_us << ", dropping" << std::endl;
                    break;
                }
                monitor.tick(frame.timestamp_us);
                frames.push_back(std::move(frame));
                break;
            case FrameStatus::TIMEOUT:
                break;
            case FrameStatus::END_OF_STREAM:
                std::cout << "[frames] Frame source reached end of stream" << std::endl;
                streaming = false;
                break;
            case FrameStatus::ERROR:
                throw CaptureError("frame capture failed: " + frame_source_.last_error());
        }
    }

    if (options_.live_out) {
        monitor.report(*options_.live_out);
    }
    summary = monitor.summary();
    return frames;
}

std::vector<KeyEvent> CaptureOrchestrator::capture_keys_(uint64_t& dropped) {
    SPSCRingBuffer<KeyEvent> pending(options_.key_buffer_capacity);
    std::atomic<uint64_t> dropped_count{0};
    std::vector<KeyEvent> key_events;
    const int64_t delay_us = options_.key_delay_us;

    {
        // Callbacks run on the key source's delivery thread, the buffer's only producer.
        std::vector<KeySubscription> subscriptions;
        subscriptions.reserve(options_.recording_keys.size());
        for (const auto& key : options_.recording_keys) {
            subscriptions.emplace_back(
                key_source_, key,
                [&pending, &dropped_count, delay_us](const KeyTransition& transition) {
                    if (!pending.push(KeyEvent(transition.key, transition.timestamp_us + delay_us, transition.down))) {
                        dropped_count.fetch_add(1, std::memory_order_relaxed);
                    }
                });
        }

        while (!stop_signal_.is_set()) {
            drain(pending, key_events);
            if (key_source_.failed()) {
                throw CaptureError("key capture failed: " + key_source_.last_error());
            }
            stop_signal_.wait_for(options_.poll_interval);
        }
    }
    // Hooks are released, nothing is pushing anymore.
    drain(pending, key_events);

    dropped = dropped_count.load();
    if (dropped > 0) {
        std::cerr << "[keys] Key buffer full, dropped " << dropped << " key events" << std::endl;
    }
    return key_events;
}

void CaptureOrchestrator::watch_for_finish_() {
    while (!stop_signal_.is_set()) {
        if (finish_trigger_.wait_for(WATCHER_SLICE)) {
            stop_signal_.set();
        }
    }
}

CaptureResult CaptureOrchestrator::run() {
    CaptureResult result;
    CaptureMonitorSummary frame_summary{};
    uint64_t dropped_keys = 0;

    // A failing task raises the stop signal before its exception escapes,
    // so the surviving tasks return instead of running on.
    auto frames_future = std::async(std::launch::async, [this, &frame_summary] {
        try {
            return capture_frames_(frame_summary);
        } catch (...) {
            stop_signal_.set();
            throw;
        }
    });
    auto keys_future = std::async(std::launch::async, [this, &dropped_keys] {
        try {
            return capture_keys_(dropped_keys);
        } catch (...) {
            stop_signal_.set();
            throw;
        }
    });
    auto watcher_future = std::async(std::launch::async, [this] {
        try {
            watch_for_finish_();
        } catch (...) {
            stop_signal_.set();
            throw;
        }
    });

    // Join every task before reporting anything.
    std::exception_ptr failure;
    try {
        result.frames = frames_future.get();
    } catch (...) {
        failure = std::current_exception();
    }
    try {
        result.key_events = keys_future.get();
    } catch (...) {
        if (!failure) failure = std::current_exception();
    }
    try {
        watcher_future.get();
    } catch (...) {
        if (!failure) failure = std::current_exception();
    }

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const CaptureError&) {
            throw;
        } catch (const std::exception& e) {
            throw CaptureError(e.what());
        }
    }

    result.stats.frames = frame_summary;
    result.stats.dropped_key_events = dropped_keys;
    std::cout << "[capture] Captured " << result.frames.size() << " frames and "
              << result.key_events.size() << " key events" << std::endl;
    return result;
}
