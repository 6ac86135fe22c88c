#include "capture_monitor.hpp"

#include <iomanip>

constexpr int64_t ONE_SECOND_US = 1'000'000;

CaptureMonitor::CaptureMonitor(double target_fps, std::ostream* live_out)
    : nominal_interval_us_(target_fps > 0 ? static_cast<int64_t>(ONE_SECOND_US / target_fps) : 0),
      live_out_(live_out), num_frames_(0), frame_gaps_(0), longest_interval_us_(0),
      first_ts_us_(0), last_ts_us_(0), last_print_us_(0) {}

void CaptureMonitor::tick(int64_t frame_timestamp_us) {
    if (num_frames_ == 0) {
        first_ts_us_ = frame_timestamp_us;
        last_print_us_ = frame_timestamp_us;
    } else {
        int64_t interval = frame_timestamp_us - last_ts_us_;
        if (interval > longest_interval_us_) {
            longest_interval_us_ = interval;
        }
        // Check gap in frame timing
        if (nominal_interval_us_ > 0 && interval > 2 * nominal_interval_us_) {
            frame_gaps_++;
        }
    }
    num_frames_++;
    last_ts_us_ = frame_timestamp_us;

    // Update rolling window
    window_.push_back(frame_timestamp_us);
    while (!window_.empty() && window_.front() <= frame_timestamp_us - ONE_SECOND_US) {
        window_.pop_front();
    }

    if (live_out_ && frame_timestamp_us - last_print_us_ >= ONE_SECOND_US) {
        print_live_metrics_(frame_timestamp_us);
        last_print_us_ = frame_timestamp_us;
    }
}

double CaptureMonitor::rolling_fps() const {
    if (window_.size() < 2) {
        return 0.0;
    }
    int64_t span = window_.back() - window_.front();
    return span > 0 ? (window_.size() - 1) * static_cast<double>(ONE_SECOND_US) / span : 0.0;
}

void CaptureMonitor::print_live_metrics_(int64_t now_us) {
    int64_t elapsed_s = (now_us - first_ts_us_) / ONE_SECOND_US;
    *live_out_ << "\rVideo Recorder Stats: "
               << std::setfill('0') << std::setw(2) << elapsed_s / 60 << ":"
               << std::setw(2) << elapsed_s % 60 << std::setfill(' ')
               << "  " << std::fixed << std::setprecision(1) << rolling_fps() << " fps   "
               << std::flush;
}

CaptureMonitorSummary CaptureMonitor::summary() const {
    CaptureMonitorSummary s{};
    s.total_frames = num_frames_;
    s.frame_gaps = frame_gaps_;
    s.longest_interval_us = longest_interval_us_;
    int64_t span = last_ts_us_ - first_ts_us_;
    s.mean_fps = (num_frames_ > 1 && span > 0)
        ? (num_frames_ - 1) * static_cast<double>(ONE_SECOND_US) / span
        : 0.0;
    return s;
}

void CaptureMonitor::report(std::ostream& out) const {
    CaptureMonitorSummary s = summary();
    out << "\n=== Capture Report ===" << std::endl;
    out << "Total frames captured: " << s.total_frames << std::endl;
    out << "Mean fps: " << std::fixed << std::setprecision(2) << s.mean_fps << std::endl;
    out << "Frame gaps: " << s.frame_gaps
        << " (longest interval " << s.longest_interval_us / 1000 << " ms)" << std::endl;
    out << "======================" << std::endl;
}
