#include "dataset_logger.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

std::string escape_json(const std::string& text) {
    std::ostringstream out;
    for (char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\t': out << "\\t"; break;
            case '\r': out << "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

DatasetLogger::DatasetLogger() : lines_written_(0) {}

bool DatasetLogger::initialize(const std::string& path) {
    output_path_ = path;
    lines_written_ = 0;
    log_file_.open(path, std::ios::out | std::ios::trunc);

    if (!log_file_.is_open()) {
        std::cerr << "Failed to open dataset log file: " << path << std::endl;
        return false;
    }
    return true;
}

bool DatasetLogger::log_item(size_t index, const DatasetItem& item) {
    if (!log_file_.is_open()) {
        std::cerr << "DatasetLogger not initialized" << std::endl;
        return false;
    }

    // Create JSON line
    std::ostringstream json_line;
    json_line << "{"
              << "\"index\":" << index << ","
              << "\"frame_index\":" << item.frame_index << ","
              << "\"timestamp_us\":" << item.timestamp_us << ","
              << "\"keys\":[";
    for (size_t i = 0; i < item.keys.size(); i++) {
        if (i > 0) json_line << ",";
        json_line << "\"" << escape_json(item.keys[i]) << "\"";
    }
    json_line << "]}" << "\n";

    log_file_ << json_line.str();
    lines_written_++;
    return log_file_.good();
}

void DatasetLogger::finalize() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

DatasetLogger::~DatasetLogger() {
    finalize();
}
