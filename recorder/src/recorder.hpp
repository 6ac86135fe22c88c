#pragma once

#include <csignal>
#include <string>

#include "capture_orchestrator.hpp"
#include "key_event_source.hpp"
#include "recorder_config.hpp"
#include "stream_merger.hpp"

// Cleared by SIGINT/SIGTERM or the quit key. Ends the current session without saving.
extern volatile sig_atomic_t keep_running;

void signal_handler(int signal);

enum class SessionOutcome {
    SAVED,            // dataset exported
    DISCARDED_EMPTY,  // nothing survived the merge, not exported
    FAILED,           // backend or export failure, not exported
    ABORTED           // stopped by the user, not exported
};

const char* session_outcome_name(SessionOutcome outcome);

/*
    Records sessions one after another. Each session owns a fresh screen
    capture pipeline; the keyboard outlives sessions because the start and
    quit keys are watched between them.
*/
class Recorder {
    private:
        const RecorderConfig& config_;
        KeyEventSource& keyboard_;

        CaptureOptions capture_options_() const;
        MergeOptions merge_options_() const;

    public:
        Recorder(const RecorderConfig& config, KeyEventSource& keyboard);

        SessionOutcome record_session();

        // Merges a finished capture and exports it. Split out of record_session()
        // so it runs without capture hardware.
        SessionOutcome finish_session(const CaptureResult& capture);
};
