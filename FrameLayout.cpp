#include "FrameLayout.h"

#include <stdexcept>
#include <sstream>

bool CropLayout::isValid(std::string* reason) const
{
  std::ostringstream why;

  if (original_width <= 0 || original_height <= 0 ||
      frame_width <= 0 || frame_height <= 0 || code_size <= 0) {
    why << "all frame dimensions must be positive";
  }
  else if (frame_width > original_width || frame_height > original_height) {
    why << "primary view " << frame_width << "x" << frame_height
        << " exceeds capture " << original_width << "x" << original_height;
  }
  else if (code_size > original_width || code_size > original_height) {
    why << "code region " << code_size << " exceeds capture "
        << original_width << "x" << original_height;
  }
  else if ((primaryRect() & codeRect()).area() > 0) {
    why << "primary view and code region overlap";
  }

  std::string msg = why.str();
  if (reason) *reason = msg;
  return msg.empty();
}

FramePair splitFrame(const cv::Mat& capture, int64_t sim_time,
                     const CropLayout& layout, int64_t frame_id)
{
  if (capture.size() != layout.captureSize()) {
    std::ostringstream msg;
    msg << "capture is " << capture.cols << "x" << capture.rows
        << ", layout expects " << layout.original_width << "x" << layout.original_height;
    throw std::invalid_argument(msg.str());
  }

  FramePair pair;
  pair.primary = capture(layout.primaryRect()).clone();
  pair.code = capture(layout.codeRect()).clone();
  pair.sim_time = sim_time;
  pair.frame_id = frame_id;
  return pair;
}

void drawTimestamp(cv::Mat& frame, const std::string& text, cv::Point origin)
{
  const int font = cv::FONT_HERSHEY_SIMPLEX;
  const double scale = 0.7;
  const int thickness = 1;

  int baseline = 0;
  cv::Size size = cv::getTextSize(text, font, scale, thickness, &baseline);

  cv::rectangle(frame,
                cv::Point(origin.x - 5, origin.y - size.height - 5),
                cv::Point(origin.x + size.width + 5, origin.y + baseline + 5),
                cv::Scalar(0, 0, 0), cv::FILLED);

  cv::putText(frame, text, origin, font, scale,
              cv::Scalar(0, 255, 255), thickness, cv::LINE_AA);
}
