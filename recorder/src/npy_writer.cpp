#include "npy_writer.hpp"

#include <iostream>
#include <sstream>

// Total header length is padded to a multiple of this.
constexpr size_t NPY_HEADER_ALIGNMENT = 64;

std::string npy_header(const std::vector<size_t>& shape) {
    std::ostringstream dict;
    dict << "{'descr': '|u1', 'fortran_order': False, 'shape': (";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) dict << ", ";
        dict << shape[i];
    }
    if (shape.size() == 1) dict << ",";
    dict << "), }";

    // magic (6) + version (2) + header length (2) + dict + padding + '\n'
    std::string body = dict.str();
    const size_t prefix = 10;
    size_t total = prefix + body.size() + 1;
    size_t padding = (NPY_HEADER_ALIGNMENT - total % NPY_HEADER_ALIGNMENT) % NPY_HEADER_ALIGNMENT;
    body.append(padding, ' ');
    body.push_back('\n');

    std::string header("\x93NUMPY", 6);
    header.push_back('\x01');
    header.push_back('\x00');
    const uint16_t header_len = static_cast<uint16_t>(body.size());
    header.push_back(static_cast<char>(header_len & 0xff));  // little endian
    header.push_back(static_cast<char>(header_len >> 8));
    header += body;
    return header;
}

NpyWriter::NpyWriter() : row_size_(0), rows_written_(0) {}

bool NpyWriter::initialize(const std::string& path, const std::vector<size_t>& shape) {
    output_path_ = path;
    shape_ = shape;
    rows_written_ = 0;
    row_size_ = 1;
    for (size_t i = 1; i < shape_.size(); i++) {
        row_size_ *= shape_[i];
    }

    if (shape_.empty()) {
        std::cerr << "NpyWriter needs at least one dimension: " << path << std::endl;
        return false;
    }

    file_.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        std::cerr << "Failed to open npy file: " << path << std::endl;
        return false;
    }

    const std::string header = npy_header(shape_);
    file_.write(header.data(), static_cast<std::streamsize>(header.size()));
    return file_.good();
}

bool NpyWriter::write_row(const uint8_t* data, size_t size) {
    if (!file_.is_open()) {
        std::cerr << "NpyWriter not initialized" << std::endl;
        return false;
    }
    if (size != row_size_) {
        std::cerr << "NpyWriter row size mismatch for " << output_path_ << ": got " << size
                  << " bytes, expected " << row_size_ << std::endl;
        return false;
    }
    if (rows_written_ >= shape_[0]) {
        std::cerr << "NpyWriter row overflow for " << output_path_ << std::endl;
        return false;
    }

    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    rows_written_++;
    return file_.good();
}

bool NpyWriter::finalize() {
    if (!file_.is_open()) {
        return false;
    }
    file_.close();
    if (file_.fail()) {
        std::cerr << "Failed to write npy file: " << output_path_ << std::endl;
        return false;
    }
    if (rows_written_ != shape_[0]) {
        std::cerr << "NpyWriter wrote " << rows_written_ << " of " << shape_[0]
                  << " rows to " << output_path_ << std::endl;
        return false;
    }
    return true;
}

NpyWriter::~NpyWriter() {
    if (file_.is_open()) {
        file_.close();
    }
}
