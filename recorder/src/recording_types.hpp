#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Current time on the clock shared by the frame and key producers (in microseconds).
inline int64_t now_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// One key transition. timestamp_us is delivery time plus the configured delay.
struct KeyEvent {
    std::string key;
    int64_t timestamp_us;
    bool down;

    KeyEvent() : timestamp_us(0), down(false) {}
    KeyEvent(std::string key_name, int64_t ts_us, bool is_down)
        : key(std::move(key_name)), timestamp_us(ts_us), down(is_down) {}
};

// Screen frame structure containing all frame data
struct ScreenFrame {
    uint64_t sequence_number;
    int64_t timestamp_us;  // Timestamp in microseconds
    int width;
    int height;
    int channels;  // packed BGR, no row padding
    std::vector<uint8_t> image_data;

    ScreenFrame() : sequence_number(0), timestamp_us(0), width(0), height(0), channels(0) {}
};

// One row of the training dataset.
struct DatasetItem {
    const ScreenFrame* frame;  // owned by the capture result
    size_t frame_index;
    std::vector<std::string> keys;  // sorted
    int64_t timestamp_us;

    DatasetItem() : frame(nullptr), frame_index(0), timestamp_us(0) {}
};

inline double us_to_sec(int64_t us) {
    return static_cast<double>(us) / 1'000'000.0;
}

inline int64_t sec_to_us(double sec) {
    return static_cast<int64_t>(sec * 1'000'000.0 + (sec < 0 ? -0.5 : 0.5));
}
