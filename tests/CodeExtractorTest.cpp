#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "CodeExtractor.h"

using namespace std::chrono_literals;

namespace {

// Finds a code whenever the code view's first pixel is non-zero; the text is
// scripted by the test. A pixel value of 255 makes the detector throw.
class FakeDecoder : public ICodeDecoder {
public:
  explicit FakeDecoder(std::string text) : text_(std::move(text)) {}

  bool decode(const cv::Mat& image, std::string& text) override {
    uchar v = image.at<cv::Vec3b>(0, 0)[0];
    if (v == 255) throw std::runtime_error("detector failure");
    if (v == 0) return false;
    text = text_;
    return true;
  }

private:
  std::string text_;
};

FramePair makePair(uchar code_value, int64_t sim_time)
{
  FramePair pair;
  pair.primary = cv::Mat(48, 64, CV_8UC3, cv::Scalar(1, 2, 3));
  pair.code = cv::Mat(16, 16, CV_8UC3, cv::Scalar(code_value, 0, 0));
  pair.sim_time = sim_time;
  return pair;
}

class CodeExtractorTest : public ::testing::Test {
protected:
  CodeExtractorTest()
    : decode_queue(4), event_queue(2),
      extractor(std::make_unique<FakeDecoder>("1700000000000|1|1|6"),
                decode_queue, event_queue, slot, stats)
  {
    extractor.setEnqueueTimeout(5ms);
  }

  BoundedQueue<FramePair> decode_queue;
  BoundedQueue<CodePayload> event_queue;
  LiveFrameSlot slot;
  PipelineStats stats;
  CodeExtractor extractor;
};

} // namespace

TEST_F(CodeExtractorTest, FrameWithoutCodeIsStillPublished)
{
  EXPECT_FALSE(extractor.process(makePair(0, 100)));

  cv::Mat frame;
  int64_t sim_time = 0;
  ASSERT_TRUE(slot.read(frame, sim_time));
  EXPECT_EQ(sim_time, 100);
  EXPECT_EQ(event_queue.size(), 0u);
  EXPECT_EQ(stats.frames_processed.load(), 1u);
  EXPECT_EQ(stats.qr_decoded.load(), 0u);
}

TEST_F(CodeExtractorTest, DecodedCodeIsQueuedWithFrameTime)
{
  EXPECT_TRUE(extractor.process(makePair(7, 250)));

  CodePayload payload;
  ASSERT_EQ(event_queue.pop_front(payload, 10ms), QueueResult::OK);
  EXPECT_EQ(payload.raw, "1700000000000|1|1|6");
  EXPECT_EQ(payload.sim_time, 250);
  EXPECT_FALSE(payload.isStructured());
  EXPECT_EQ(stats.qr_decoded.load(), 1u);
}

TEST_F(CodeExtractorTest, DecoderExceptionMeansNoCode)
{
  EXPECT_FALSE(extractor.process(makePair(255, 300)));
  EXPECT_EQ(event_queue.size(), 0u);
  EXPECT_TRUE(slot.hasFrame());
  EXPECT_EQ(stats.frames_processed.load(), 1u);
}

TEST_F(CodeExtractorTest, FullEventQueueDropsPayloadButKeepsPublishing)
{
  for (int i = 0; i < 3; i++) {
    extractor.process(makePair(7, 400 + i));
  }
  EXPECT_EQ(event_queue.size(), 2u);
  EXPECT_EQ(stats.events_dropped.load(), 1u);
  EXPECT_EQ(slot.sequence(), 3u);

  cv::Mat frame;
  int64_t sim_time = 0;
  slot.read(frame, sim_time);
  EXPECT_EQ(sim_time, 402);
}

TEST(CodePayload, JsonTextIsAlsoCarriedStructured)
{
  CodePayload payload = makeCodePayload("{\"kind\": 5}", 1);
  ASSERT_TRUE(payload.isStructured());
  EXPECT_TRUE(json_is_object(payload.structured.get()));
  EXPECT_EQ(payload.raw, "{\"kind\": 5}");

  EXPECT_TRUE(makeCodePayload("42", 1).isStructured());
  EXPECT_FALSE(makeCodePayload("1|2|3|4", 1).isStructured());
}

TEST_F(CodeExtractorTest, StatsLineEveryLogInterval)
{
  extractor.setLogInterval(2);

  testing::internal::CaptureStdout();
  extractor.process(makePair(0, 100));
  std::string after_one = testing::internal::GetCapturedStdout();

  testing::internal::CaptureStdout();
  extractor.process(makePair(0, 200));
  std::string after_two = testing::internal::GetCapturedStdout();

  EXPECT_EQ(after_one.find("CodeExtractor: Stats:"), std::string::npos);
  EXPECT_NE(after_two.find("CodeExtractor: Stats:"), std::string::npos);
  EXPECT_NE(after_two.find("Published=2"), std::string::npos);
}
