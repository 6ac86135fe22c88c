#include "recorder.hpp"

#include <iostream>

#include "finish_trigger.hpp"
#include "screen_capture_pipeline.hpp"
#include "session_exporter.hpp"

// Global flag for signal handling - needs to be accessible from static signal handler
volatile sig_atomic_t keep_running = 1;

// Static signal handler function
void signal_handler(int) {
    keep_running = 0;
}

const char* session_outcome_name(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::SAVED: return "saved";
        case SessionOutcome::DISCARDED_EMPTY: return "discarded";
        case SessionOutcome::FAILED: return "failed";
        case SessionOutcome::ABORTED: return "aborted";
    }
    return "unknown";
}

Recorder::Recorder(const RecorderConfig& config, KeyEventSource& keyboard)
    : config_(config), keyboard_(keyboard) {}

CaptureOptions Recorder::capture_options_() const {
    CaptureOptions options;
    options.recording_keys = config_.recording_keys;
    options.key_delay_us = sec_to_us(config_.key_delay_sec);
    options.target_fps = config_.max_fps;
    return options;
}

MergeOptions Recorder::merge_options_() const {
    MergeOptions options;
    options.discard_tail_us = sec_to_us(config_.discard_tail_sec);
    options.orphan_policy = config_.orphan_policy;
    return options;
}

SessionOutcome Recorder::record_session() {
    CaptureResult capture;
    try {
        // Scoped to the session: the pipeline is torn down on every exit path
        ScreenCapturePipeline screen;
        if (!screen.initialize(config_)) {
            throw CaptureError("screen capture setup failed: " + screen.last_error());
        }
        KeyFinishTrigger finish_trigger(keyboard_, config_.finish_key, &keep_running);
        CaptureOrchestrator orchestrator(screen, keyboard_, finish_trigger, capture_options_());
        capture = orchestrator.run();
    } catch (const CaptureError& e) {
        std::cerr << "session failed: " << e.what() << "\n" << std::endl;
        return SessionOutcome::FAILED;
    }

    if (!keep_running) {
        std::cout << "recording aborted, session not saved\n" << std::endl;
        return SessionOutcome::ABORTED;
    }
    return finish_session(capture);
}

SessionOutcome Recorder::finish_session(const CaptureResult& capture) {
    MergeResult merged;
    try {
        merged = merge_streams(capture.key_events, capture.frames, merge_options_());
    } catch (const InconsistentKeyStateError& e) {
        std::cerr << "session failed: " << e.what() << "\n" << std::endl;
        return SessionOutcome::FAILED;
    }

    std::cout << "[merge] " << merged.items.size() << " items from " << capture.frames.size()
              << " frames (" << merged.stats.tail_frames_discarded << " tail frames, "
              << merged.stats.key_events_applied << " key events applied)" << std::endl;

    if (merged.empty()) {
        std::cout << "skipping saving dataset due to empty content\n" << std::endl;
        return SessionOutcome::DISCARDED_EMPTY;
    }

    SessionExporter exporter(config_);
    std::string folder;
    if (!exporter.export_session(merged, capture.stats, folder)) {
        std::cerr << "session failed: could not export to " << (folder.empty() ? config_.output_dir : folder)
                  << "\n" << std::endl;
        return SessionOutcome::FAILED;
    }
    std::cout << "saved data to " << folder << "\n" << std::endl;
    return SessionOutcome::SAVED;
}
