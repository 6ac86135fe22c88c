#include "metadata_writer.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>

#include "dataset_logger.hpp"

bool MetadataWriter::write_metadata(
    const std::string& path,
    const RecorderConfig& config,
    const SessionSummary& session,
    const CaptureStats& capture_stats,
    const MergeStats& merge_stats
) {
    std::ofstream metadata_file(path);
    if (!metadata_file.is_open()) {
        std::cerr << "Failed to create metadata file: " << path << std::endl;
        return false;
    }

    // Get current timestamp
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    // Write JSON metadata
    metadata_file << "{\n";
    metadata_file << "  \"recording_info\": {\n";
    metadata_file << "    \"timestamp\": \"" << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    metadata_file << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\",\n";
    metadata_file << std::setfill(' ');
    metadata_file << "    \"recorder_version\": \"1.0.0\",\n";
    metadata_file << "    \"format_version\": \"1.0.0\"\n";
    metadata_file << "  },\n";

    metadata_file << "  \"recorder_config\": {\n";
    metadata_file << "    \"recording_keys\": [";
    for (size_t i = 0; i < config.recording_keys.size(); i++) {
        if (i > 0) metadata_file << ", ";
        metadata_file << "\"" << escape_json(config.recording_keys[i]) << "\"";
    }
    metadata_file << "],\n";
    metadata_file << "    \"finish_key\": \"" << escape_json(config.finish_key) << "\",\n";
    metadata_file << "    \"discard_tail_sec\": " << config.discard_tail_sec << ",\n";
    metadata_file << "    \"key_delay_sec\": " << config.key_delay_sec << ",\n";
    metadata_file << "    \"orphan_release_policy\": \""
                  << (config.orphan_policy == OrphanReleasePolicy::ABORT ? "abort" : "ignore") << "\",\n";
    metadata_file << "    \"max_fps\": " << config.max_fps << ",\n";
    metadata_file << "    \"output_width\": " << config.output_width << ",\n";
    metadata_file << "    \"output_height\": " << config.output_height << ",\n";
    metadata_file << "    \"region\": ";
    if (config.region.is_full_screen()) {
        metadata_file << "null\n";
    } else {
        metadata_file << "[" << config.region.x << ", " << config.region.y << ", "
                      << config.region.width << ", " << config.region.height << "]\n";
    }
    metadata_file << "  },\n";

    metadata_file << "  \"dataset\": {\n";
    metadata_file << "    \"items\": " << session.item_count << ",\n";
    metadata_file << "    \"frame_width\": " << session.frame_width << ",\n";
    metadata_file << "    \"frame_height\": " << session.frame_height << ",\n";
    metadata_file << "    \"first_timestamp_us\": " << session.first_timestamp_us << ",\n";
    metadata_file << "    \"last_timestamp_us\": " << session.last_timestamp_us << ",\n";
    metadata_file << "    \"average_fps\": ";
    if (session.average_fps) {
        metadata_file << std::fixed << std::setprecision(3) << *session.average_fps;
    } else {
        metadata_file << "null";
    }
    metadata_file << ",\n";
    metadata_file << "    \"video_fps\": " << std::fixed << std::setprecision(3) << session.video_fps << "\n";
    metadata_file << "  },\n";

    metadata_file << "  \"capture_stats\": {\n";
    metadata_file << "    \"frames_captured\": " << capture_stats.frames.total_frames << ",\n";
    metadata_file << "    \"capture_fps\": " << capture_stats.frames.mean_fps << ",\n";
    metadata_file << "    \"frame_gaps\": " << capture_stats.frames.frame_gaps << ",\n";
    metadata_file << "    \"longest_frame_interval_us\": " << capture_stats.frames.longest_interval_us << ",\n";
    metadata_file << "    \"dropped_key_events\": " << capture_stats.dropped_key_events << "\n";
    metadata_file << "  },\n";

    metadata_file << "  \"merge_stats\": {\n";
    metadata_file << "    \"key_events_applied\": " << merge_stats.key_events_applied << ",\n";
    metadata_file << "    \"orphan_releases\": " << merge_stats.orphan_releases << ",\n";
    metadata_file << "    \"trailing_key_events\": " << merge_stats.trailing_key_events << ",\n";
    metadata_file << "    \"tail_frames_discarded\": " << merge_stats.tail_frames_discarded << ",\n";
    metadata_file << "    \"key_events_resorted\": " << (merge_stats.key_events_resorted ? "true" : "false") << "\n";
    metadata_file << "  }\n";
    metadata_file << "}\n";

    metadata_file.close();
    if (metadata_file.fail()) {
        std::cerr << "Failed to write metadata file: " << path << std::endl;
        return false;
    }
    return true;
}
