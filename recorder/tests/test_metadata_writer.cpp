#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "metadata_writer.hpp"

namespace {

namespace fs = std::filesystem;

std::string write_and_read(const RecorderConfig& config, const SessionSummary& session) {
    const fs::path path = fs::temp_directory_path() / "playrec_metadata_test.json";
    fs::remove(path);

    CaptureStats capture_stats{};
    capture_stats.frames.total_frames = 120;
    capture_stats.frames.mean_fps = 29.5;
    capture_stats.dropped_key_events = 2;
    MergeStats merge_stats;
    merge_stats.key_events_applied = 14;
    merge_stats.orphan_releases = 1;

    EXPECT_TRUE(MetadataWriter::write_metadata(path.string(), config, session, capture_stats, merge_stats));
    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    fs::remove(path);
    return contents;
}

TEST(MetadataWriterTest, RecordsConfigAndStats) {
    RecorderConfig config;
    config.region = CaptureRegion{10, 20, 640, 480};
    SessionSummary session;
    session.item_count = 30;
    session.frame_width = 180;
    session.frame_height = 100;
    session.average_fps = 30.0;
    session.video_fps = 30.0;

    const std::string json = write_and_read(config, session);
    EXPECT_NE(json.find("\"recording_keys\": [\"w\", \"a\", \"s\", \"d\"]"), std::string::npos);
    EXPECT_NE(json.find("\"orphan_release_policy\": \"ignore\""), std::string::npos);
    EXPECT_NE(json.find("\"region\": [10, 20, 640, 480]"), std::string::npos);
    EXPECT_NE(json.find("\"items\": 30"), std::string::npos);
    EXPECT_NE(json.find("\"average_fps\": 30.000"), std::string::npos);
    EXPECT_NE(json.find("\"frames_captured\": 120"), std::string::npos);
    EXPECT_NE(json.find("\"dropped_key_events\": 2"), std::string::npos);
    EXPECT_NE(json.find("\"orphan_releases\": 1"), std::string::npos);
}

TEST(MetadataWriterTest, UnknownAverageRateIsNull) {
    RecorderConfig config;
    config.orphan_policy = OrphanReleasePolicy::ABORT;
    SessionSummary session;
    session.item_count = 1;

    const std::string json = write_and_read(config, session);
    EXPECT_NE(json.find("\"average_fps\": null"), std::string::npos);
    EXPECT_NE(json.find("\"region\": null"), std::string::npos);
    EXPECT_NE(json.find("\"orphan_release_policy\": \"abort\""), std::string::npos);
}

TEST(MetadataWriterTest, UnwritablePathFails) {
    RecorderConfig config;
    SessionSummary session;
    EXPECT_FALSE(MetadataWriter::write_metadata("/nonexistent-dir/metadata.json", config, session,
                                                CaptureStats{}, MergeStats{}));
}

}  // namespace
