#ifndef IFRAME_SOURCE_H
#define IFRAME_SOURCE_H

#include "opencv2/opencv.hpp"
#include <chrono>
#include <cstdint>

struct FrameMetadata {
    int64_t frameID;          // frames delivered since the source was (re)opened
    int64_t sourceIndex;      // position inside the clip
    std::chrono::steady_clock::time_point systemTime;
};

class IFrameSource {
public:
  virtual ~IFrameSource() = default;

  virtual bool getNextFrame(cv::Mat& frame, FrameMetadata& metadata) = 0;
  virtual bool isOpen() const = 0;
  // Tear down and restart the underlying decoder
  virtual bool reopen() = 0;
  virtual float getFrameRate() const = 0;
  virtual int getWidth() const = 0;
  virtual int getHeight() const = 0;
  virtual void close() = 0;
  virtual bool isLooping() const { return true; }
};

#endif
