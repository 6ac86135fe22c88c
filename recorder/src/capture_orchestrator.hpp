#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cancellation_signal.hpp"
#include "capture_monitor.hpp"
#include "finish_trigger.hpp"
#include "frame_source.hpp"
#include "key_event_source.hpp"
#include "recording_types.hpp"

// A frame or key backend failed during capture. The session is not exported.
class CaptureError : public std::runtime_error {
    public:
        explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

struct CaptureOptions {
    std::vector<std::string> recording_keys;
    int64_t key_delay_us = -10'000;  // added to every key timestamp
    double target_fps = 30.0;        // nominal rate, for gap detection
    size_t key_buffer_capacity = 4096;
    std::chrono::milliseconds poll_interval{5};
    std::ostream* live_out = &std::cout;  // live capture stats, null to disable
};

struct CaptureStats {
    CaptureMonitorSummary frames;
    uint64_t dropped_key_events = 0;
};

struct CaptureResult {
    std::vector<ScreenFrame> frames;    // non-decreasing timestamps
    std::vector<KeyEvent> key_events;   // delivery order
    CaptureStats stats;
};

/*
    Runs one recording session: frame capture, key capture and the
    termination watcher run concurrently until the finish trigger fires.
    run() returns only after all three tasks have returned. If either
    producer fails, the other is told to stop and run() throws CaptureError.
*/
class CaptureOrchestrator {
    private:
        FrameSource& frame_source_;
        KeyEventSource& key_source_;
        FinishTrigger& finish_trigger_;
        CaptureOptions options_;
        CancellationSignal stop_signal_;

        std::vector<ScreenFrame> capture_frames_(CaptureMonitorSummary& summary);
        std::vector<KeyEvent> capture_keys_(uint64_t& dropped);
        void watch_for_finish_();

    public:
        CaptureOrchestrator(
            FrameSource& frame_source,
            KeyEventSource& key_source,
            FinishTrigger& finish_trigger,
            CaptureOptions options
        );

        CaptureResult run();

        // Stops a running session from outside. Normal termination goes through the finish trigger.
        void cancel() { stop_signal_.set(); }
};
