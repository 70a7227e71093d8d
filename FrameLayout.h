#ifndef FRAME_LAYOUT_H
#define FRAME_LAYOUT_H

#include <cstdint>
#include <string>
#include "opencv2/opencv.hpp"

// Where the two views sit inside one captured frame. The primary view is
// the top-left frame_width x frame_height region; the code view is the
// code_size square in the bottom-right corner of the capture.
struct CropLayout {
  int original_width = 800;
  int original_height = 640;
  int frame_width = 640;
  int frame_height = 480;
  int code_size = 160;

  cv::Rect primaryRect() const { return cv::Rect(0, 0, frame_width, frame_height); }
  cv::Rect codeRect() const {
    return cv::Rect(original_width - code_size, original_height - code_size,
                    code_size, code_size);
  }
  cv::Size captureSize() const { return cv::Size(original_width, original_height); }

  // Both regions inside the capture and disjoint
  bool isValid(std::string* reason = nullptr) const;
};

struct FramePair {
  cv::Mat primary;
  cv::Mat code;
  int64_t sim_time = 0;
  int64_t frame_id = 0;
};

// Crops deep copies of both views. Throws std::invalid_argument when the
// capture does not have the layout's resolution.
FramePair splitFrame(const cv::Mat& capture, int64_t sim_time,
                     const CropLayout& layout, int64_t frame_id = 0);

// Yellow text on a filled black box, baseline at `origin`
void drawTimestamp(cv::Mat& frame, const std::string& text,
                   cv::Point origin = cv::Point(10, 40));

#endif // FRAME_LAYOUT_H
