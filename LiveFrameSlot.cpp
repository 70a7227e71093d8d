#include "LiveFrameSlot.h"

LiveFrameSlot::LiveFrameSlot()
    : sim_time_(0), sequence_(0)
{
}

void LiveFrameSlot::publish(const cv::Mat& frame, int64_t sim_time)
{
    std::lock_guard<std::mutex> lock(mutex_);
    frame_ = frame;  // Shallow copy is fine - OpenCV Mat is reference-counted
    sim_time_ = sim_time;
    sequence_++;
}

bool LiveFrameSlot::read(cv::Mat& frame, int64_t& sim_time, uint64_t* sequence) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (frame_.empty()) {
        return false;
    }
    frame = frame_;
    sim_time = sim_time_;
    if (sequence) *sequence = sequence_;
    return true;
}

bool LiveFrameSlot::copyFrame(cv::Mat& frame, int64_t& sim_time) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (frame_.empty()) {
        return false;
    }
    frame = frame_.clone();  // Deep copy
    sim_time = sim_time_;
    return true;
}

bool LiveFrameSlot::hasFrame() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !frame_.empty();
}

uint64_t LiveFrameSlot::sequence() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}
