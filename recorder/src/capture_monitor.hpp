#pragma once

#include <cstdint>
#include <deque>
#include <iostream>
#include <string>

struct CaptureMonitorSummary {
    uint64_t total_frames;
    uint64_t frame_gaps;         // intervals longer than twice the nominal period
    int64_t longest_interval_us;
    double mean_fps;             // over the whole capture
};

/*
    Tracks frame timing while the screen is being captured and prints a
    one-line live status once per second.
*/
class CaptureMonitor {
private:
    int64_t nominal_interval_us_;
    std::ostream* live_out_;
    uint64_t num_frames_;
    uint64_t frame_gaps_;
    int64_t longest_interval_us_;
    int64_t first_ts_us_;
    int64_t last_ts_us_;
    int64_t last_print_us_;
    std::deque<int64_t> window_;  // frame timestamps from the last second

    void print_live_metrics_(int64_t now_us);

public:
    // `live_out` may be null to disable the live line.
    CaptureMonitor(double target_fps, std::ostream* live_out = &std::cout);

    void tick(int64_t frame_timestamp_us);

    // Frames per second over the last second of frames.
    double rolling_fps() const;

    CaptureMonitorSummary summary() const;
    void report(std::ostream& out) const;
};
