#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "recording_types.hpp"

// What to do with an "up" for a key that is not in the active key set
// (held before recording started, or its "down" was dropped).
enum class OrphanReleasePolicy {
    IGNORE,  // count it and carry on
    ABORT    // throw InconsistentKeyStateError
};

class InconsistentKeyStateError : public std::runtime_error {
    public:
        explicit InconsistentKeyStateError(const std::string& what) : std::runtime_error(what) {}
};

struct MergeOptions {
    int64_t discard_tail_us = 3'000'000;
    OrphanReleasePolicy orphan_policy = OrphanReleasePolicy::IGNORE;
};

struct MergeStats {
    uint64_t key_events_applied = 0;
    uint64_t orphan_releases = 0;
    uint64_t trailing_key_events = 0;   // after the last retained frame, never applied
    uint64_t tail_frames_discarded = 0;
    bool key_events_resorted = false;
};

struct MergeResult {
    std::vector<DatasetItem> items;
    MergeStats stats;

    // An empty result means the session should not be exported.
    bool empty() const { return items.empty(); }
};

/*
    Two-pointer temporal merge of the finished key and frame sequences.

    Each retained frame gets the set of keys held down according to every key
    event with a timestamp strictly before the frame's. Frames later than
    (last frame timestamp - discard_tail_us) are dropped. Items point into
    `frames`, which must outlive the result.

    Pure function of its inputs, except that it throws InconsistentKeyStateError
    under OrphanReleasePolicy::ABORT.
*/
MergeResult merge_streams(
    const std::vector<KeyEvent>& key_events,
    const std::vector<ScreenFrame>& frames,
    const MergeOptions& options
);

// (count - 1) / (last - first) in frames per second. Empty when fewer than two
// items or a non-positive time span leave the rate undefined.
std::optional<double> average_frame_rate(const std::vector<DatasetItem>& items);

// Multi-hot encoding of `keys`, one byte per recording key, in recording key order.
std::vector<uint8_t> encode_keys(
    const std::vector<std::string>& keys,
    const std::vector<std::string>& recording_keys
);
