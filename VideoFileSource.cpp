#include <thread>
#include <iostream>
#include <stdexcept>

#include "VideoFileSource.h"

VideoFileSource::VideoFileSource(const std::string& videoFile,
                                 float targetFps,
                                 int width, int height,
                                 bool rateLimited,
                                 bool loopPlayback)
    : path_(videoFile)
    , target_fps_(targetFps > 0 ? targetFps : 15.0f)
    , source_fps_(0.0f)
    , width_(width)
    , height_(height)
    , output_idx_(0)
    , clip_tick_(0)
    , decoded_idx_(0)
    , rate_limit_(rateLimited)
    , loop_playback_(loopPlayback)
    , resize_logged_(false)
{
    if (!openCapture()) {
        throw std::runtime_error("Failed to open video file: " + videoFile);
    }
}

bool VideoFileSource::openCapture() {
    cap.open(path_, cv::CAP_FFMPEG);
    if (!cap.isOpened()) {
        return false;
    }

    source_fps_ = cap.get(cv::CAP_PROP_FPS);
    if (source_fps_ <= 0.0f) source_fps_ = target_fps_;

    output_idx_ = 0;
    clip_tick_ = 0;
    decoded_idx_ = 0;
    last_frame_.release();
    playback_start_ = std::chrono::steady_clock::now();
    return true;
}

bool VideoFileSource::reopen() {
    cap.release();
    return openCapture();
}

bool VideoFileSource::decodeNext() {
    cv::Mat frame;
    if (!cap.read(frame) || frame.empty()) {
        return false;
    }

    if (frame.cols != width_ || frame.rows != height_) {
        if (!resize_logged_) {
            std::cout << "VideoFileSource: resizing " << frame.cols << "x" << frame.rows
                      << " to " << width_ << "x" << height_ << std::endl;
            resize_logged_ = true;
        }
        cv::resize(frame, frame, cv::Size(width_, height_), 0, 0, cv::INTER_LINEAR);
    }
    if (frame.channels() == 1) {
        cv::cvtColor(frame, frame, cv::COLOR_GRAY2BGR);
    }

    last_frame_ = frame;
    decoded_idx_++;
    return true;
}

bool VideoFileSource::getNextFrame(cv::Mat& frame, FrameMetadata& metadata) {
    if (!cap.isOpened()) {
        return false;
    }

    if (rate_limit_ && output_idx_ > 0) {
        auto target_time = playback_start_ +
            std::chrono::microseconds((int64_t)(output_idx_ * 1e6 / target_fps_));
        std::this_thread::sleep_until(target_time);
    }

    // Source frame shown at this output tick
    int64_t wanted = (int64_t)(clip_tick_ * source_fps_ / target_fps_);

    while (decoded_idx_ <= wanted) {
        if (decodeNext()) continue;

        if (!loop_playback_) return false;

        rewind();
        wanted = 0;
        if (!decodeNext()) {
            return false;
        }
    }

    if (last_frame_.empty()) {
        return false;
    }

    // Caller draws on the frame, so never hand out the cached one
    frame = last_frame_.clone();

    metadata.frameID = output_idx_;
    metadata.sourceIndex = decoded_idx_ - 1;
    metadata.systemTime = std::chrono::steady_clock::now();

    output_idx_++;
    clip_tick_++;
    return true;
}

void VideoFileSource::rewind() {
  cap.set(cv::CAP_PROP_POS_FRAMES, 0);
  clip_tick_ = 0;
  decoded_idx_ = 0;
}

VideoFileSource::~VideoFileSource() {
  close();
}
