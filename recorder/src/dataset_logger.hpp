#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "recording_types.hpp"

// Writes one JSON line per dataset item: index, frame timestamp and held keys.
class DatasetLogger {
private:
    std::ofstream log_file_;
    std::string output_path_;
    uint64_t lines_written_;

public:
    DatasetLogger();

    bool initialize(const std::string& path);
    bool log_item(size_t index, const DatasetItem& item);
    void finalize();

    uint64_t lines_written() const { return lines_written_; }

    ~DatasetLogger();
};

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string escape_json(const std::string& text);
