#include "session_exporter.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include "dataset_logger.hpp"
#include "metadata_writer.hpp"
#include "npy_writer.hpp"
#include "video_writer.hpp"

namespace {

std::string timestamped_folder_name() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream name;
    name << std::put_time(std::localtime(&time_t), "%Y%m%d-%H%M%S");
    return name.str();
}

// Removes a partially written session folder unless dismissed.
class SessionFolderGuard {
    private:
        std::filesystem::path dir_;
        bool dismissed_;

    public:
        explicit SessionFolderGuard(std::filesystem::path dir) : dir_(std::move(dir)), dismissed_(false) {}
        ~SessionFolderGuard() {
            if (dismissed_) {
                return;
            }
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
            if (ec) {
                std::cerr << "[export] Failed to remove incomplete " << dir_ << ": " << ec.message() << std::endl;
            } else {
                std::cerr << "[export] Removed incomplete " << dir_ << std::endl;
            }
        }
        SessionFolderGuard(const SessionFolderGuard&) = delete;
        SessionFolderGuard& operator=(const SessionFolderGuard&) = delete;

        void dismiss() { dismissed_ = true; }
};

}  // namespace

double video_frame_rate(const std::vector<DatasetItem>& items, double fallback_fps) {
    std::optional<double> fps = average_frame_rate(items);
    if (fps) {
        return *fps;
    }
    std::cerr << "[export] Cannot derive average fps from " << items.size()
              << " item(s), encoding video at " << fallback_fps << " fps" << std::endl;
    return fallback_fps;
}

SessionExporter::SessionExporter(const RecorderConfig& config) : config_(config) {}

bool SessionExporter::export_session(
    const MergeResult& merged,
    const CaptureStats& capture_stats,
    std::string& folder
) {
    const std::vector<DatasetItem>& items = merged.items;
    if (items.empty()) {
        std::cerr << "[export] Refusing to export an empty session" << std::endl;
        return false;
    }
    const ScreenFrame& first = *items.front().frame;
    const size_t width = static_cast<size_t>(first.width);
    const size_t height = static_cast<size_t>(first.height);

    // Create output directory, suffixing if two sessions end within one second
    std::filesystem::path base(config_.output_dir);
    std::string name = timestamped_folder_name();
    std::filesystem::path session_dir = base / name;
    for (int suffix = 1; std::filesystem::exists(session_dir); suffix++) {
        session_dir = base / (name + "-" + std::to_string(suffix));
    }
    std::error_code ec;
    std::filesystem::create_directories(session_dir, ec);
    if (ec) {
        std::cerr << "[export] Failed to create " << session_dir << ": " << ec.message() << std::endl;
        return false;
    }
    folder = session_dir.string();
    // Declared before the writers so their files are closed before removal
    SessionFolderGuard folder_guard(session_dir);

    SessionSummary summary;
    summary.item_count = items.size();
    summary.frame_width = width;
    summary.frame_height = height;
    summary.first_timestamp_us = items.front().timestamp_us;
    summary.last_timestamp_us = items.back().timestamp_us;
    summary.average_fps = average_frame_rate(items);
    summary.video_fps = video_frame_rate(items, config_.max_fps);
    if (summary.average_fps) {
        std::cout << "average fps = " << std::fixed << std::setprecision(2) << *summary.average_fps << std::endl;
    }

    NpyWriter screens_writer;
    NpyWriter keys_writer;
    VideoWriter video_writer;
    DatasetLogger dataset_logger;

    // Initialize output files
    if (!screens_writer.initialize((session_dir / SCREENS_FILENAME).string(), {items.size(), height, width, 3}) ||
        !keys_writer.initialize((session_dir / KEYS_FILENAME).string(), {items.size(), config_.recording_keys.size()}) ||
        !video_writer.initialize((session_dir / VIDEO_FILENAME).string(),
                                 static_cast<int>(width), static_cast<int>(height), summary.video_fps) ||
        !dataset_logger.initialize((session_dir / DATASET_LOG_FILENAME).string())) {
        std::cerr << "[export] Failed to initialize output files in " << folder << std::endl;
        return false;
    }

    for (size_t i = 0; i < items.size(); i++) {
        const DatasetItem& item = items[i];
        const std::vector<uint8_t> encoded = encode_keys(item.keys, config_.recording_keys);
        if (!screens_writer.write_row(item.frame->image_data.data(), item.frame->image_data.size()) ||
            !keys_writer.write_row(encoded.data(), encoded.size()) ||
            !video_writer.write_frame(*item.frame) ||
            !dataset_logger.log_item(i, item)) {
            std::cerr << "[export] Failed to write item " << i << " to " << folder << std::endl;
            return false;
        }
    }

    // Finalize output files
    bool ok = screens_writer.finalize();
    ok = keys_writer.finalize() && ok;
    video_writer.finalize();
    dataset_logger.finalize();
    ok = MetadataWriter::write_metadata(
        (session_dir / METADATA_FILENAME).string(), config_, summary, capture_stats, merged.stats) && ok;
    if (ok) {
        folder_guard.dismiss();
    }
    return ok;
}
