#pragma once

#include <string>
#include <vector>

#include "capture_orchestrator.hpp"
#include "recorder_config.hpp"
#include "stream_merger.hpp"

// File names inside a session folder
constexpr const char* SCREENS_FILENAME = "screens.npy";
constexpr const char* KEYS_FILENAME = "keys.npy";
constexpr const char* VIDEO_FILENAME = "video.avi";
constexpr const char* DATASET_LOG_FILENAME = "dataset_log.jsonl";
constexpr const char* METADATA_FILENAME = "metadata.json";

/*
    Writes one merged session to <output_dir>/<YYYYmmdd-HHMMSS>/:
    stacked frames, stacked key encodings, an XVID video at the average
    frame rate, a per-item JSONL log and metadata.json.
*/
class SessionExporter {
private:
    const RecorderConfig& config_;

public:
    explicit SessionExporter(const RecorderConfig& config);

    // Returns false if any artifact could not be written. `folder` receives the session folder.
    bool export_session(
        const MergeResult& merged,
        const CaptureStats& capture_stats,
        std::string& folder
    );
};

// Frame rate to encode the video at: the measured average, or `fallback_fps`.
double video_frame_rate(const std::vector<DatasetItem>& items, double fallback_fps);
