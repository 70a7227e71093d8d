#ifndef ICODE_DECODER_H
#define ICODE_DECODER_H

#include <string>
#include "opencv2/opencv.hpp"

class ICodeDecoder {
public:
  virtual ~ICodeDecoder() = default;

  // True when a code was found and decoded into `text`. May throw when the
  // underlying detector fails; callers treat that as "no code".
  virtual bool decode(const cv::Mat& image, std::string& text) = 0;
};

#endif
