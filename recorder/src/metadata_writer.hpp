#pragma once

#include <optional>
#include <string>

#include "capture_orchestrator.hpp"
#include "recorder_config.hpp"
#include "stream_merger.hpp"

struct SessionSummary {
    size_t item_count = 0;
    size_t frame_width = 0;
    size_t frame_height = 0;
    int64_t first_timestamp_us = 0;
    int64_t last_timestamp_us = 0;
    std::optional<double> average_fps;  // empty when it could not be derived
    double video_fps = 0.0;             // rate the video was encoded at
};

class MetadataWriter {
public:
    static bool write_metadata(
        const std::string& path,
        const RecorderConfig& config,
        const SessionSummary& session,
        const CaptureStats& capture_stats,
        const MergeStats& merge_stats
    );
};
