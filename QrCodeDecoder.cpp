#include "QrCodeDecoder.h"

bool QrCodeDecoder::decode(const cv::Mat& image, std::string& text)
{
  if (image.empty()) return false;

  std::vector<cv::Point> corners;
  text = detector_.detectAndDecode(image, corners);
  return !text.empty();
}
