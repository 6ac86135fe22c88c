#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

/*
    Streams a C-order uint8 array into a NumPy .npy (format 1.0) file.
    The shape is fixed up front; rows are appended one by one and finalize()
    checks that exactly shape[0] rows were written.
*/
class NpyWriter {
private:
    std::ofstream file_;
    std::string output_path_;
    std::vector<size_t> shape_;
    size_t row_size_;
    size_t rows_written_;

public:
    NpyWriter();

    bool initialize(const std::string& path, const std::vector<size_t>& shape);
    // `size` must equal the product of shape[1..].
    bool write_row(const uint8_t* data, size_t size);
    bool finalize();

    ~NpyWriter();
};

// Header bytes (magic, version, length, dict, padding) for a uint8 array of `shape`.
std::string npy_header(const std::vector<size_t>& shape);
