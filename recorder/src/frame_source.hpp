#pragma once

#include <chrono>
#include <string>

#include "recording_types.hpp"

enum class FrameStatus {
    FRAME,          // `frame` holds a new frame
    TIMEOUT,        // nothing arrived within the timeout, try again
    END_OF_STREAM,  // the source will produce no more frames
    ERROR           // backend failure, see last_error()
};

/*
    Produces timestamped frames of a screen region at a bounded rate.
    Frames from one source have non-decreasing timestamps.
*/
class FrameSource {
    public:
        virtual ~FrameSource() = default;

        virtual bool start() = 0;
        // Safe to call more than once, and without a prior start().
        virtual void stop() = 0;

        // Waits at most `timeout` for the next frame.
        virtual FrameStatus next(ScreenFrame& frame, std::chrono::milliseconds timeout) = 0;

        virtual std::string last_error() const = 0;
};
