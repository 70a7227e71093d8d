#ifndef QR_CODE_DECODER_H
#define QR_CODE_DECODER_H

#include "ICodeDecoder.h"

class QrCodeDecoder : public ICodeDecoder {
private:
  cv::QRCodeDetector detector_;

public:
  QrCodeDecoder() = default;

  bool decode(const cv::Mat& image, std::string& text) override;
};

#endif
