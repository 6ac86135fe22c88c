#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "dataset_logger.hpp"

namespace {

namespace fs = std::filesystem;

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(DatasetLoggerTest, WritesOneJsonLinePerItem) {
    const fs::path path = fs::temp_directory_path() / "playrec_dataset_log_test.jsonl";
    fs::remove(path);

    ScreenFrame frame;
    DatasetItem first;
    first.frame = &frame;
    first.frame_index = 4;
    first.timestamp_us = 1'500'000;
    first.keys = {"a", "w"};
    DatasetItem second;
    second.frame = &frame;
    second.frame_index = 5;
    second.timestamp_us = 1'533'333;

    {
        DatasetLogger logger;
        ASSERT_TRUE(logger.initialize(path.string()));
        ASSERT_TRUE(logger.log_item(0, first));
        ASSERT_TRUE(logger.log_item(1, second));
        EXPECT_EQ(logger.lines_written(), 2u);
        logger.finalize();
    }

    std::vector<std::string> lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "{\"index\":0,\"frame_index\":4,\"timestamp_us\":1500000,\"keys\":[\"a\",\"w\"]}");
    EXPECT_EQ(lines[1], "{\"index\":1,\"frame_index\":5,\"timestamp_us\":1533333,\"keys\":[]}");
    fs::remove(path);
}

TEST(DatasetLoggerTest, LogBeforeInitializeFails) {
    DatasetLogger logger;
    DatasetItem item;
    EXPECT_FALSE(logger.log_item(0, item));
    EXPECT_EQ(logger.lines_written(), 0u);
}

TEST(DatasetLoggerTest, EscapesJsonStrings) {
    EXPECT_EQ(escape_json("plain"), "plain");
    EXPECT_EQ(escape_json("a\"b"), "a\\\"b");
    EXPECT_EQ(escape_json("back\\slash"), "back\\\\slash");
    EXPECT_EQ(escape_json("tab\there\n"), "tab\\there\\n");
    EXPECT_EQ(escape_json(std::string("\x01", 1)), "\\u0001");
}

}  // namespace
