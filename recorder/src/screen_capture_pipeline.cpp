#include "screen_capture_pipeline.hpp"

#include <cstring>
#include <iostream>
#include <thread>

// ScreenCapturePipeline constructor
ScreenCapturePipeline::ScreenCapturePipeline()
    : pipeline_(nullptr), source_(nullptr), rate_(nullptr), convert_(nullptr),
      scale_(nullptr), capsfilter_(nullptr), queue_(nullptr), sink_(nullptr),
      bus_(nullptr), sequence_counter_(0),
      frames_(std::make_unique<SPSCRingBuffer<ScreenFrame>>(SCREEN_FRAME_BUFFER_CAPACITY)),
      dropped_frames_(0) {}

// ScreenCapturePipeline destructor
ScreenCapturePipeline::~ScreenCapturePipeline() {
    stop();
    if (bus_) {
        gst_object_unref(bus_);
    }
    if (pipeline_) {
        gst_object_unref(pipeline_);
    }
}

// Static callback function for appsink, runs on the GStreamer streaming thread
GstFlowReturn ScreenCapturePipeline::on_new_sample_(GstAppSink* appsink, gpointer user_data) {
    ScreenCapturePipeline* pipeline = static_cast<ScreenCapturePipeline*>(user_data);

    // Stamp before any copying so the timestamp is as close to arrival as possible
    const int64_t timestamp_us = now_us();

    // Pull the sample
    GstSample* sample = gst_app_sink_pull_sample(appsink);
    if (!sample) {
        return GST_FLOW_ERROR;
    }

    // Get buffer and caps
    GstBuffer* buffer = gst_sample_get_buffer(sample);
    GstCaps* caps = gst_sample_get_caps(sample);

    if (!buffer || !caps) {
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }

    // Extract frame information
    GstStructure* structure = gst_caps_get_structure(caps, 0);
    int width = 0, height = 0;
    if (!gst_structure_get_int(structure, "width", &width) ||
        !gst_structure_get_int(structure, "height", &height)) {
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }

    // Map buffer to access data
    GstMapInfo map;
    if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }

    ScreenFrame frame;
    frame.sequence_number = ++pipeline->sequence_counter_;
    frame.timestamp_us = timestamp_us;
    frame.width = width;
    frame.height = height;
    frame.channels = 3;

    // BGR rows are padded to 4 bytes in GStreamer buffers, strip the padding
    const size_t row_bytes = static_cast<size_t>(width) * 3;
    const size_t stride = GST_ROUND_UP_4(row_bytes);
    if (height <= 0 || map.size < stride * static_cast<size_t>(height - 1) + row_bytes) {
        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }
    frame.image_data.resize(row_bytes * static_cast<size_t>(height));
    for (int row = 0; row < height; row++) {
        std::memcpy(frame.image_data.data() + static_cast<size_t>(row) * row_bytes,
                    map.data + static_cast<size_t>(row) * stride, row_bytes);
    }

    // Unmap buffer and clean up
    gst_buffer_unmap(buffer, &map);
    gst_sample_unref(sample);

    if (!pipeline->frames_->push(std::move(frame))) {
        pipeline->dropped_frames_++;
    }
    return GST_FLOW_OK;
}

bool ScreenCapturePipeline::initialize(const RecorderConfig& config) {
    // Initialize GStreamer. Safe to repeat.
    gst_init(nullptr, nullptr);

    pipeline_ = gst_pipeline_new("screen-pipeline");
    source_ = gst_element_factory_make("ximagesrc", "screen-source");
    rate_ = gst_element_factory_make("videorate", "rate-limit");
    convert_ = gst_element_factory_make("videoconvert", "convert");
    scale_ = gst_element_factory_make("videoscale", "scale");
    capsfilter_ = gst_element_factory_make("capsfilter", "caps-filter");
    queue_ = gst_element_factory_make("queue", "ring-buffer");
    sink_ = gst_element_factory_make("appsink", "app-sink");

    // Check if elements were created successfully
    if (!pipeline_ || !source_ || !rate_ || !convert_ || !scale_ || !capsfilter_ || !queue_ || !sink_) {
        set_error_("Failed to create GStreamer elements");
        g_printerr("Failed to create GStreamer elements\n");
        return false;
    }

    // Screen source
    g_object_set(source_, "use-damage", FALSE, nullptr);
    g_object_set(source_, "show-pointer", FALSE, nullptr);
    if (!config.display_name.empty()) {
        g_object_set(source_, "display-name", config.display_name.c_str(), nullptr);
    }
    if (!config.region.is_full_screen()) {
        g_object_set(source_,
            "startx", static_cast<guint>(config.region.x),
            "starty", static_cast<guint>(config.region.y),
            "endx", static_cast<guint>(config.region.x + config.region.width - 1),
            "endy", static_cast<guint>(config.region.y + config.region.height - 1),
            nullptr);
    }

    // Only drop frames to respect max_fps, never duplicate them
    g_object_set(rate_, "drop-only", TRUE, nullptr);
    g_object_set(rate_, "max-rate", config.max_fps, nullptr);

    GstCaps *caps = gst_caps_new_simple("video/x-raw",
        "format", G_TYPE_STRING, "BGR",
        "width", G_TYPE_INT, config.output_width,
        "height", G_TYPE_INT, config.output_height,
        nullptr);
    g_object_set(capsfilter_, "caps", caps, nullptr);
    gst_caps_unref(caps);

    g_object_set(queue_, "max-size-buffers", 30, nullptr);
    g_object_set(queue_, "leaky", 2, nullptr); // downstream

    // Configure appsink
    g_object_set(sink_, "emit-signals", FALSE, nullptr);
    g_object_set(sink_, "sync", FALSE, nullptr);
    g_object_set(sink_, "max-buffers", 1, nullptr);  // Keep only latest frame
    g_object_set(sink_, "drop", TRUE, nullptr);      // Drop old frames if not consumed

    GstAppSinkCallbacks callbacks = {};
    callbacks.new_sample = on_new_sample_;
    gst_app_sink_set_callbacks(GST_APP_SINK(sink_), &callbacks, this, nullptr);

    // Add elements and link
    gst_bin_add_many(GST_BIN(pipeline_), source_, rate_, convert_, scale_, capsfilter_, queue_, sink_, nullptr);
    if (!gst_element_link_many(source_, rate_, convert_, scale_, capsfilter_, queue_, sink_, nullptr)) {
        set_error_("Failed to link GStreamer elements");
        g_printerr("Failed to link GStreamer elements\n");
        return false;
    }

    bus_ = gst_element_get_bus(pipeline_);
    return true;
}

bool ScreenCapturePipeline::start() {
    if (!pipeline_) {
        set_error_("Pipeline not initialized");
        g_printerr("Pipeline not initialized\n");
        return false;
    }

    GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        // The bus usually says why
        check_bus_();
        if (last_error().empty()) {
            set_error_("Failed to start pipeline");
        }
        g_printerr("Failed to start pipeline: %s\n", last_error().c_str());
        return false;
    }

    return true;
}

void ScreenCapturePipeline::stop() {
    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
    }
    if (dropped_frames_.load() > 0) {
        std::cerr << "[screen] Frame buffer full, dropped " << dropped_frames_.load() << " frames" << std::endl;
        dropped_frames_ = 0;
    }
}

FrameStatus ScreenCapturePipeline::next(ScreenFrame& frame, std::chrono::milliseconds timeout) {
    const auto poll_interval = std::chrono::microseconds(500);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (frames_->pop(frame)) {
            return FrameStatus::FRAME;
        }
        FrameStatus bus_status = check_bus_();
        if (bus_status != FrameStatus::TIMEOUT) {
            return bus_status;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return FrameStatus::TIMEOUT;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

FrameStatus ScreenCapturePipeline::check_bus_() {
    if (!bus_) {
        return FrameStatus::TIMEOUT;
    }
    GstMessage* msg = gst_bus_pop_filtered(
        bus_, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));
    if (!msg) {
        return FrameStatus::TIMEOUT;
    }

    FrameStatus status = FrameStatus::END_OF_STREAM;
    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
        GError* err = nullptr;
        gchar* debug_info = nullptr;
        gst_message_parse_error(msg, &err, &debug_info);
        std::string message = std::string(GST_OBJECT_NAME(msg->src)) + ": "
            + (err ? err->message : "unknown error");
        if (debug_info) {
            message += " (" + std::string(debug_info) + ")";
        }
        set_error_(message);
        g_clear_error(&err);
        g_free(debug_info);
        status = FrameStatus::ERROR;
    }
    gst_message_unref(msg);
    return status;
}

void ScreenCapturePipeline::set_error_(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mtx_);
    last_error_ = message;
}

std::string ScreenCapturePipeline::last_error() const {
    std::lock_guard<std::mutex> lock(error_mtx_);
    return last_error_;
}
