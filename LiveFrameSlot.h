#ifndef LIVE_FRAME_SLOT_H
#define LIVE_FRAME_SLOT_H

#include <mutex>
#include <cstdint>
#include "opencv2/opencv.hpp"

// Holds the most recent primary view for broadcast. One writer replaces the
// frame, any number of readers take it. A published Mat is never written to
// again, so a reader holding a reference always sees a whole frame.
class LiveFrameSlot {
private:
    cv::Mat frame_;
    int64_t sim_time_;
    uint64_t sequence_;       // number of publishes so far
    mutable std::mutex mutex_;

public:
    LiveFrameSlot();

    // The slot takes over `frame`; the caller must not modify its pixels
    // afterwards.
    void publish(const cv::Mat& frame, int64_t sim_time);

    // Shared reference to the current frame. Returns false before the first
    // publish.
    bool read(cv::Mat& frame, int64_t& sim_time, uint64_t* sequence = nullptr) const;

    // Deep copy of the current frame
    bool copyFrame(cv::Mat& frame, int64_t& sim_time) const;

    bool hasFrame() const;
    uint64_t sequence() const;
};

#endif // LIVE_FRAME_SLOT_H
