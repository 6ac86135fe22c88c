#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <memory>
#include "recording_types.hpp"

class VideoWriter {
private:
    std::unique_ptr<cv::VideoWriter> writer_;
    std::string output_path_;
    int width_;
    int height_;
    bool is_initialized_;

public:
    VideoWriter();

    bool initialize(const std::string& path, int width, int height, double fps, const std::string& codec = "XVID");
    // Writes a packed BGR frame. The frame must match the initialized size.
    bool write_frame(const ScreenFrame& frame);
    void finalize();

    ~VideoWriter();
};
