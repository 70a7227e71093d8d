#ifndef FRAME_SERVER_H
#define FRAME_SERVER_H

#include <cstdint>
#include "opencv2/opencv.hpp"

#include "LiveFrameSlot.h"
#include "StreamSessionRegistry.h"

struct ServedFrame {
  cv::Mat frame;
  int64_t sim_time = 0;
  bool live = false;      // false when the blank frame was served
  StreamTick tick;
};

// What one client receives on one engine tick: the current live frame (or
// a black frame before the first publish) timed on the client's own clock.
class FrameServer {
private:
  const LiveFrameSlot& slot_;
  StreamSessionRegistry& registry_;
  cv::Mat blank_;

public:
  FrameServer(const LiveFrameSlot& slot, StreamSessionRegistry& registry,
              int width, int height);

  ServedFrame next(SessionId id);

  // Latest live frame, or the blank one. Does not touch any session.
  cv::Mat currentFrame() const;

  const cv::Mat& blankFrame() const { return blank_; }
};

#endif // FRAME_SERVER_H
