#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stream_merger.hpp"

// Largest accepted |discard tail| or |key delay|. Keeps every microsecond
// timestamp computed from them far inside int64_t.
constexpr int MAX_TIME_OFFSET_SEC = 24 * 60 * 60;

// Screen area to capture, in screen pixels. width == 0 means the whole screen.
struct CaptureRegion {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool is_full_screen() const { return width == 0 && height == 0; }
};

struct RecorderConfig {
    std::string output_dir = "data";

    // Keys whose held state is recorded. Order defines the keys.npy columns.
    std::vector<std::string> recording_keys = {"w", "a", "s", "d"};
    std::string finish_key = "space";  // save the session and start the next one
    std::string start_key = "e";
    std::string quit_key = "q";

    // Drop the last N seconds so the stopping action isn't learnt.
    double discard_tail_sec = 3.0;
    // Shift key timestamps by N seconds to compensate for hook delay.
    double key_delay_sec = -0.010;
    OrphanReleasePolicy orphan_policy = OrphanReleasePolicy::IGNORE;

    // Screen capture
    int max_fps = 30;
    int output_width = 180;
    int output_height = 100;
    CaptureRegion region;
    std::string display_name;  // empty = $DISPLAY

    // Empty = auto-detect keyboards under /dev/input
    std::vector<std::string> keyboard_devices;

    // Returns one message per problem, empty if the config is usable.
    std::vector<std::string> validate() const;
};

// Parses "180x100". Returns false if malformed.
bool parse_size(const std::string& text, int& width, int& height);

// Parses "x,y,w,h". Returns false if malformed.
bool parse_region(const std::string& text, CaptureRegion& region);

/*
    Applies command-line flags to `config`. Returns false with `error` set on an
    unknown flag or a missing/malformed value. Sets `show_help` for --help.
*/
bool parse_arguments(int argc, char** argv, RecorderConfig& config, bool& show_help, std::string& error);

void print_usage(const char* program_name);
