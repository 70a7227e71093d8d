#ifndef VIDEO_FILE_SOURCE_H
#define VIDEO_FILE_SOURCE_H

#include "IFrameSource.h"
#include <string>

// Replays a clip at a fixed output rate. Frames are delivered at the
// capture resolution given to the constructor; the clip's native rate is
// resampled to the output rate by skipping or repeating frames.
class VideoFileSource : public IFrameSource {
private:
  cv::VideoCapture cap;
  std::string path_;

  float target_fps_;
  float source_fps_;
  int width_, height_;

  int64_t output_idx_;      // frames delivered since open
  int64_t clip_tick_;       // output ticks since the last rewind
  int64_t decoded_idx_;     // frames decoded since the last rewind
  cv::Mat last_frame_;

  // Playback control
  std::chrono::steady_clock::time_point playback_start_;
  bool rate_limit_;
  bool loop_playback_;
  bool resize_logged_;

  bool openCapture();
  bool decodeNext();
  void rewind();

public:
  VideoFileSource(const std::string& videoFile,
                  float targetFps,
                  int width, int height,
                  bool rateLimited = true,
                  bool loopPlayback = true);

  ~VideoFileSource();

  bool getNextFrame(cv::Mat& frame, FrameMetadata& metadata) override;
  bool isOpen() const override { return cap.isOpened(); }
  bool reopen() override;
  float getFrameRate() const override { return target_fps_; }
  int getWidth() const override { return width_; }
  int getHeight() const override { return height_; }
  void close() override { cap.release(); }

  float getSourceFrameRate() const { return source_fps_; }
  bool isLooping() const override { return loop_playback_; }
};

#endif
