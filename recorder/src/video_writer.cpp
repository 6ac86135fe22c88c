#include "video_writer.hpp"

#include <iostream>

VideoWriter::VideoWriter() : width_(0), height_(0), is_initialized_(false) {}

bool VideoWriter::initialize(const std::string& path, int width, int height, double fps, const std::string& codec) {
    output_path_ = path;
    width_ = width;
    height_ = height;

    if (codec.size() != 4) {
        std::cerr << "VideoWriter codec must be a FOURCC, got '" << codec << "'" << std::endl;
        return false;
    }

    // Create VideoWriter with specified codec
    int fourcc = cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]);
    writer_ = std::make_unique<cv::VideoWriter>(path, fourcc, fps, cv::Size(width, height));

    if (!writer_->isOpened()) {
        std::cerr << "Failed to initialize VideoWriter for " << path << std::endl;
        writer_.reset();
        return false;
    }

    is_initialized_ = true;
    std::cout << "VideoWriter initialized: " << path << " (" << width << "x" << height << " @ " << fps << "fps)" << std::endl;
    return true;
}

bool VideoWriter::write_frame(const ScreenFrame& frame) {
    if (!is_initialized_ || !writer_) {
        std::cerr << "VideoWriter not initialized" << std::endl;
        return false;
    }
    if (frame.width != width_ || frame.height != height_ || frame.channels != 3 ||
        frame.image_data.size() != static_cast<size_t>(width_) * height_ * 3) {
        std::cerr << "VideoWriter frame seq:" << frame.sequence_number << " is " << frame.width << "x"
                  << frame.height << "x" << frame.channels << ", expected " << width_ << "x" << height_
                  << "x3" << std::endl;
        return false;
    }

    // Frames are already BGR, wrap without copying
    cv::Mat bgr_image(frame.height, frame.width, CV_8UC3, const_cast<uint8_t*>(frame.image_data.data()));
    writer_->write(bgr_image);
    return true;
}

void VideoWriter::finalize() {
    if (writer_) {
        writer_->release();
        writer_.reset();
        std::cout << "VideoWriter finalized: " << output_path_ << std::endl;
    }
    is_initialized_ = false;
}

VideoWriter::~VideoWriter() {
    finalize();
}
