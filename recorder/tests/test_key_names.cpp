#include <gtest/gtest.h>

#include <linux/input-event-codes.h>

#include <cstdint>
#include <string>
#include <vector>

#include "key_names.hpp"
#include "stream_merger.hpp"

namespace {

TEST(KeyNamesTest, MapsNamesToEvdevCodes) {
    EXPECT_EQ(key_code_from_name("w"), KEY_W);
    EXPECT_EQ(key_code_from_name("space"), KEY_SPACE);
    EXPECT_EQ(key_code_from_name("f5"), KEY_F5);
    EXPECT_EQ(key_code_from_name("left"), KEY_LEFT);
    EXPECT_EQ(key_code_from_name("7"), KEY_7);
}

TEST(KeyNamesTest, LookupIgnoresCaseAndSpaces) {
    EXPECT_EQ(key_code_from_name(" W "), KEY_W);
    EXPECT_EQ(key_code_from_name("Space"), KEY_SPACE);
}

TEST(KeyNamesTest, UnknownNames) {
    EXPECT_EQ(key_code_from_name("hyper"), UNKNOWN_KEY_CODE);
    EXPECT_EQ(key_code_from_name(""), UNKNOWN_KEY_CODE);
    EXPECT_FALSE(is_known_key("ww"));
    EXPECT_TRUE(is_known_key("enter"));
}

TEST(KeyNamesTest, ModifiersShareOneName) {
    EXPECT_EQ(key_name_from_code(KEY_LEFTSHIFT), "shift");
    EXPECT_EQ(key_name_from_code(KEY_RIGHTSHIFT), "shift");
    EXPECT_EQ(key_name_from_code(KEY_RIGHTCTRL), "ctrl");
    EXPECT_EQ(key_code_from_name("shift"), KEY_LEFTSHIFT);
}

TEST(KeyNamesTest, CodeWithoutNameIsEmpty) {
    EXPECT_EQ(key_name_from_code(KEY_MUTE), "");
    EXPECT_EQ(key_name_from_code(-5), "");
}

TEST(KeyNamesTest, SplitKeyList) {
    EXPECT_EQ(split_key_list("w,a,s,d"), (std::vector<std::string>{"w", "a", "s", "d"}));
    EXPECT_EQ(split_key_list(" W , Space,,"), (std::vector<std::string>{"w", "space"}));
    EXPECT_TRUE(split_key_list("").empty());
}

TEST(KeyStateFilterTest, SharedNameStaysDownUntilLastKeyReleased) {
    KeyStateFilter filter;
    std::string name;
    EXPECT_TRUE(filter.apply(0, KEY_LEFTSHIFT, true, name));
    EXPECT_EQ(name, "shift");
    EXPECT_FALSE(filter.apply(0, KEY_RIGHTSHIFT, true, name));
    EXPECT_FALSE(filter.apply(0, KEY_LEFTSHIFT, false, name));
    EXPECT_TRUE(filter.apply(0, KEY_RIGHTSHIFT, false, name));
    EXPECT_EQ(name, "shift");
}

TEST(KeyStateFilterTest, SameKeyOnTwoDevicesCountsTwice) {
    KeyStateFilter filter;
    std::string name;
    EXPECT_TRUE(filter.apply(0, KEY_W, true, name));
    EXPECT_FALSE(filter.apply(1, KEY_W, true, name));
    EXPECT_FALSE(filter.apply(1, KEY_W, false, name));
    EXPECT_TRUE(filter.apply(0, KEY_W, false, name));
}

TEST(KeyStateFilterTest, RepeatedDownOfOneKeyIsIgnored) {
    KeyStateFilter filter;
    std::string name;
    EXPECT_TRUE(filter.apply(0, KEY_LEFTCTRL, true, name));
    EXPECT_FALSE(filter.apply(0, KEY_LEFTCTRL, true, name));
    EXPECT_TRUE(filter.apply(0, KEY_LEFTCTRL, false, name));
}

TEST(KeyStateFilterTest, UnseenReleasePassesThroughWhenNameIsUp) {
    KeyStateFilter filter;
    std::string name;
    EXPECT_TRUE(filter.apply(0, KEY_A, false, name));
    EXPECT_EQ(name, "a");

    // Suppressed while another key of the same name is held
    EXPECT_TRUE(filter.apply(0, KEY_RIGHTALT, true, name));
    EXPECT_FALSE(filter.apply(0, KEY_LEFTALT, false, name));
}

TEST(KeyStateFilterTest, UnnamedCodesAreDropped) {
    KeyStateFilter filter;
    std::string name = "stale";
    EXPECT_FALSE(filter.apply(0, KEY_MUTE, true, name));
    EXPECT_TRUE(name.empty());
}

TEST(KeyStateFilterTest, OverlappingShiftKeysMergeWithoutOrphans) {
    struct Physical { int code; int64_t ts; bool down; };
    const std::vector<Physical> physical = {
        {KEY_LEFTSHIFT, 100, true}, {KEY_RIGHTSHIFT, 200, true},
        {KEY_LEFTSHIFT, 500, false}, {KEY_RIGHTSHIFT, 1500, false},
    };
    KeyStateFilter filter;
    std::vector<KeyEvent> keys;
    for (const auto& p : physical) {
        std::string name;
        if (filter.apply(0, p.code, p.down, name)) {
            keys.emplace_back(name, p.ts, p.down);
        }
    }
    ASSERT_EQ(keys.size(), 2u);

    std::vector<ScreenFrame> frames(3);
    for (size_t i = 0; i < frames.size(); i++) {
        frames[i].timestamp_us = static_cast<int64_t>(i) * 1000;
    }
    MergeOptions options;
    options.discard_tail_us = 0;
    options.orphan_policy = OrphanReleasePolicy::ABORT;
    MergeResult result = merge_streams(keys, frames, options);

    ASSERT_EQ(result.items.size(), 3u);
    EXPECT_TRUE(result.items[0].keys.empty());
    EXPECT_EQ(result.items[1].keys, std::vector<std::string>{"shift"});
    EXPECT_TRUE(result.items[2].keys.empty());
    EXPECT_EQ(result.stats.orphan_releases, 0u);
}

}  // namespace
