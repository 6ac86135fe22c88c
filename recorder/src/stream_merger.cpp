#include "stream_merger.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace {

bool by_timestamp(const KeyEvent& a, const KeyEvent& b) {
    return a.timestamp_us < b.timestamp_us;
}

}  // namespace

MergeResult merge_streams(
    const std::vector<KeyEvent>& key_events,
    const std::vector<ScreenFrame>& frames,
    const MergeOptions& options
) {
    MergeResult result;
    if (frames.empty()) {
        return result;
    }

    // Delivery order is normally timestamp order. Restore it if the backend broke that.
    const std::vector<KeyEvent>* keys = &key_events;
    std::vector<KeyEvent> sorted_keys;
    if (!std::is_sorted(key_events.begin(), key_events.end(), by_timestamp)) {
        sorted_keys = key_events;
        std::stable_sort(sorted_keys.begin(), sorted_keys.end(), by_timestamp);
        keys = &sorted_keys;
        result.stats.key_events_resorted = true;
        std::cerr << "[merge] Key events were not in timestamp order, re-sorted" << std::endl;
    }

    const int64_t cutoff_us = frames.back().timestamp_us - options.discard_tail_us;
    std::set<std::string> active_keys;
    size_t ki = 0;
    size_t fi = 0;

    while (fi < frames.size()) {
        const ScreenFrame& frame = frames[fi];
        if (ki < keys->size() && (*keys)[ki].timestamp_us < frame.timestamp_us) {
            const KeyEvent& event = (*keys)[ki];
            if (event.down) {
                active_keys.insert(event.key);
            } else if (active_keys.erase(event.key) == 0) {
                if (options.orphan_policy == OrphanReleasePolicy::ABORT) {
                    throw InconsistentKeyStateError(
                        "release of key '" + event.key + "' at " + std::to_string(event.timestamp_us)
                        + "us without a matching press");
                }
                result.stats.orphan_releases++;
            }
            result.stats.key_events_applied++;
            ki++;
        } else {
            if (frame.timestamp_us > cutoff_us) {
                break;
            }
            DatasetItem item;
            item.frame = &frame;
            item.frame_index = fi;
            item.keys.assign(active_keys.begin(), active_keys.end());
            item.timestamp_us = frame.timestamp_us;
            result.items.push_back(std::move(item));
            fi++;
        }
    }

    result.stats.tail_frames_discarded = frames.size() - fi;
    result.stats.trailing_key_events = keys->size() - ki;
    if (result.stats.orphan_releases > 0) {
        std::cerr << "[merge] Ignored " << result.stats.orphan_releases
                  << " key releases without a matching press" << std::endl;
    }
    return result;
}

std::optional<double> average_frame_rate(const std::vector<DatasetItem>& items) {
    if (items.size() < 2) {
        return std::nullopt;
    }
    const int64_t span_us = items.back().timestamp_us - items.front().timestamp_us;
    if (span_us <= 0) {
        return std::nullopt;
    }
    return (items.size() - 1) / us_to_sec(span_us);
}

std::vector<uint8_t> encode_keys(
    const std::vector<std::string>& keys,
    const std::vector<std::string>& recording_keys
) {
    std::vector<uint8_t> encoded(recording_keys.size(), 0);
    for (size_t i = 0; i < recording_keys.size(); i++) {
        if (std::find(keys.begin(), keys.end(), recording_keys[i]) != keys.end()) {
            encoded[i] = 1;
        }
    }
    return encoded;
}
