#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include "recorder_config.hpp"

namespace {

// Runs parse_arguments over a list of flags, prefixed by a program name.
bool parse(std::vector<std::string> args, RecorderConfig& config, bool& show_help, std::string& error) {
    args.insert(args.begin(), "playrec");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_arguments(static_cast<int>(argv.size()), argv.data(), config, show_help, error);
}

bool has_error(const std::vector<std::string>& errors, const std::string& fragment) {
    return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
        return e.find(fragment) != std::string::npos;
    });
}

TEST(RecorderConfigTest, DefaultsAreValid) {
    RecorderConfig config;
    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.recording_keys, (std::vector<std::string>{"w", "a", "s", "d"}));
    EXPECT_EQ(config.finish_key, "space");
    EXPECT_DOUBLE_EQ(config.discard_tail_sec, 3.0);
    EXPECT_DOUBLE_EQ(config.key_delay_sec, -0.010);
    EXPECT_EQ(config.orphan_policy, OrphanReleasePolicy::IGNORE);
    EXPECT_TRUE(config.region.is_full_screen());
}

TEST(RecorderConfigTest, ParsesAllFlags) {
    RecorderConfig config;
    bool show_help = true;
    std::string error;
    ASSERT_TRUE(parse({"--output-dir", "/tmp/out", "--keys", "W,Up,space", "--finish-key", "Enter",
                       "--start-key", "f1", "--quit-key", "esc", "--discard-tail-sec", "1.5",
                       "--key-delay-sec", "-0.02", "--abort-on-orphan-release", "--max-fps", "60",
                       "--size", "320x240", "--region", "10,20,640,480", "--display", ":1",
                       "--keyboard-device", "/dev/input/event3", "--keyboard-device", "/dev/input/event4"},
                      config, show_help, error)) << error;

    EXPECT_FALSE(show_help);
    EXPECT_EQ(config.output_dir, "/tmp/out");
    EXPECT_EQ(config.recording_keys, (std::vector<std::string>{"w", "up", "space"}));
    EXPECT_EQ(config.finish_key, "enter");
    EXPECT_EQ(config.start_key, "f1");
    EXPECT_EQ(config.quit_key, "esc");
    EXPECT_DOUBLE_EQ(config.discard_tail_sec, 1.5);
    EXPECT_DOUBLE_EQ(config.key_delay_sec, -0.02);
    EXPECT_EQ(config.orphan_policy, OrphanReleasePolicy::ABORT);
    EXPECT_EQ(config.max_fps, 60);
    EXPECT_EQ(config.output_width, 320);
    EXPECT_EQ(config.output_height, 240);
    EXPECT_EQ(config.region.x, 10);
    EXPECT_EQ(config.region.y, 20);
    EXPECT_EQ(config.region.width, 640);
    EXPECT_EQ(config.region.height, 480);
    EXPECT_EQ(config.display_name, ":1");
    EXPECT_EQ(config.keyboard_devices.size(), 2u);
    EXPECT_TRUE(config.validate().empty());
}

TEST(RecorderConfigTest, HelpStopsParsing) {
    RecorderConfig config;
    bool show_help = false;
    std::string error;
    EXPECT_TRUE(parse({"--help", "--bogus"}, config, show_help, error));
    EXPECT_TRUE(show_help);
}

TEST(RecorderConfigTest, RejectsBadArguments) {
    RecorderConfig config;
    bool show_help = false;
    std::string error;

    EXPECT_FALSE(parse({"--bogus", "1"}, config, show_help, error));
    EXPECT_NE(error.find("unknown argument"), std::string::npos);

    EXPECT_FALSE(parse({"--keys"}, config, show_help, error));
    EXPECT_NE(error.find("requires a value"), std::string::npos);

    EXPECT_FALSE(parse({"--discard-tail-sec", "3s"}, config, show_help, error));
    EXPECT_FALSE(parse({"--max-fps", "fast"}, config, show_help, error));
    EXPECT_FALSE(parse({"--size", "180"}, config, show_help, error));
    EXPECT_FALSE(parse({"--region", "1,2,3"}, config, show_help, error));

    // Non-finite and out-of-range numbers
    EXPECT_FALSE(parse({"--discard-tail-sec", "nan"}, config, show_help, error));
    EXPECT_FALSE(parse({"--key-delay-sec", "inf"}, config, show_help, error));
    EXPECT_FALSE(parse({"--key-delay-sec", "-infinity"}, config, show_help, error));
    EXPECT_FALSE(parse({"--key-delay-sec", "1e400"}, config, show_help, error));
    EXPECT_FALSE(parse({"--max-fps", "4294967326"}, config, show_help, error));
    EXPECT_FALSE(parse({"--size", "4294967476x100"}, config, show_help, error));
    EXPECT_EQ(config.max_fps, 30);
    EXPECT_DOUBLE_EQ(config.discard_tail_sec, 3.0);
    EXPECT_DOUBLE_EQ(config.key_delay_sec, -0.010);
}

TEST(RecorderConfigTest, ValidateRejectsHugeOrNonFiniteOffsets) {
    RecorderConfig config;
    bool show_help = false;
    std::string error;
    ASSERT_TRUE(parse({"--discard-tail-sec", "1e30", "--key-delay-sec", "-1e30"}, config, show_help, error));
    std::vector<std::string> errors = config.validate();
    EXPECT_TRUE(has_error(errors, "discard tail"));
    EXPECT_TRUE(has_error(errors, "key delay"));

    RecorderConfig direct;
    direct.discard_tail_sec = std::numeric_limits<double>::quiet_NaN();
    direct.key_delay_sec = std::numeric_limits<double>::infinity();
    errors = direct.validate();
    EXPECT_TRUE(has_error(errors, "discard tail"));
    EXPECT_TRUE(has_error(errors, "key delay"));

    RecorderConfig at_limit;
    at_limit.discard_tail_sec = MAX_TIME_OFFSET_SEC;
    at_limit.key_delay_sec = -MAX_TIME_OFFSET_SEC;
    EXPECT_TRUE(at_limit.validate().empty());
}

TEST(RecorderConfigTest, StartKeyMustDifferFromQuitKey) {
    RecorderConfig config;
    config.start_key = "q";
    EXPECT_TRUE(has_error(config.validate(), "start key and quit key must differ"));
}

TEST(RecorderConfigTest, ParseSizeAndRegion) {
    int w = 0;
    int h = 0;
    EXPECT_TRUE(parse_size("180x100", w, h));
    EXPECT_EQ(w, 180);
    EXPECT_EQ(h, 100);
    EXPECT_FALSE(parse_size("180x", w, h));
    EXPECT_FALSE(parse_size("axb", w, h));
    EXPECT_FALSE(parse_size("1x2x3", w, h));

    CaptureRegion region;
    EXPECT_TRUE(parse_region("0,0,1920,1080", region));
    EXPECT_EQ(region.width, 1920);
    EXPECT_FALSE(parse_region("0,0,1920", region));
}

TEST(RecorderConfigTest, ValidateReportsEveryProblem) {
    RecorderConfig config;
    config.recording_keys = {"w", "w", "hyper", "space"};
    config.quit_key = "space";
    config.discard_tail_sec = -1;
    config.max_fps = 0;
    config.output_width = 0;
    config.region = CaptureRegion{-1, 0, 100, 100};

    std::vector<std::string> errors = config.validate();
    EXPECT_TRUE(has_error(errors, "unknown recording key 'hyper'"));
    EXPECT_TRUE(has_error(errors, "recording key 'w' is listed more than once"));
    EXPECT_TRUE(has_error(errors, "finish key 'space' is also a recording key"));
    EXPECT_TRUE(has_error(errors, "finish key and quit key must differ"));
    EXPECT_TRUE(has_error(errors, "discard tail"));
    EXPECT_TRUE(has_error(errors, "max fps"));
    EXPECT_TRUE(has_error(errors, "output size"));
    EXPECT_TRUE(has_error(errors, "capture region"));

    // Each problem is reported once
    EXPECT_EQ(std::count(errors.begin(), errors.end(),
                         "recording key 'w' is listed more than once"), 1);
}

TEST(RecorderConfigTest, EmptyKeyListIsInvalid) {
    RecorderConfig config;
    config.recording_keys.clear();
    EXPECT_TRUE(has_error(config.validate(), "at least one recording key"));
}

}  // namespace
