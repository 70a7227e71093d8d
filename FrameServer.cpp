#include "FrameServer.h"

FrameServer::FrameServer(const LiveFrameSlot& slot, StreamSessionRegistry& registry,
                         int width, int height)
  : slot_(slot),
    registry_(registry),
    blank_(cv::Mat::zeros(height, width, CV_8UC3))
{
}

ServedFrame FrameServer::next(SessionId id)
{
  ServedFrame served;
  served.live = slot_.read(served.frame, served.sim_time);
  if (!served.live) {
    served.frame = blank_;
    served.sim_time = 0;
  }
  served.tick = registry_.advance(id, served.sim_time);
  return served;
}

cv::Mat FrameServer::currentFrame() const
{
  cv::Mat frame;
  int64_t sim_time = 0;
  if (!slot_.read(frame, sim_time)) {
    return blank_;
  }
  return frame;
}
