#ifndef SCREEN_CAPTURE_PIPELINE_H
#define SCREEN_CAPTURE_PIPELINE_H

#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "frame_source.hpp"
#include "recorder_config.hpp"
#include "spsc_ring_buffer.hpp"

// Frames buffered between the GStreamer streaming thread and the frame task.
constexpr size_t SCREEN_FRAME_BUFFER_CAPACITY = 64;

/*
    Grabs a region of the X screen with GStreamer:
    ximagesrc ! videorate ! videoconvert ! videoscale ! capsfilter ! queue ! appsink
    Frames arrive as packed BGR at the configured output size and at most
    max_fps frames per second.
*/
class ScreenCapturePipeline : public FrameSource {
private:
    GstElement *pipeline_, *source_, *rate_, *convert_, *scale_, *capsfilter_, *queue_, *sink_;
    GstBus* bus_;
    uint64_t sequence_counter_;
    std::unique_ptr<SPSCRingBuffer<ScreenFrame>> frames_;
    std::atomic<uint64_t> dropped_frames_;
    mutable std::mutex error_mtx_;
    std::string last_error_;

    // Static callback function for appsink
    static GstFlowReturn on_new_sample_(GstAppSink* appsink, gpointer user_data);

    void set_error_(const std::string& message);
    // Returns ERROR or END_OF_STREAM if the bus carries one, TIMEOUT otherwise.
    FrameStatus check_bus_();

public:
    ScreenCapturePipeline();

    bool initialize(const RecorderConfig& config);

    bool start() override;
    void stop() override;
    FrameStatus next(ScreenFrame& frame, std::chrono::milliseconds timeout) override;
    std::string last_error() const override;

    uint64_t dropped_frames() const { return dropped_frames_.load(); }

    ~ScreenCapturePipeline() override;
};

#endif // SCREEN_CAPTURE_PIPELINE_H
