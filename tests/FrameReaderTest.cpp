#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "FrameReader.h"

using namespace std::chrono_literals;

namespace {

struct SourceScript {
  int frames_before_eos = 3;   // reads that succeed before end of stream
  bool reopen_succeeds = true;
  int reads = 0;
  int reopens = 0;
  bool open = true;
};

// Delivers uniform capture-sized frames until its scripted end of stream
class FakeSource : public IFrameSource {
public:
  FakeSource(SourceScript& script, const CropLayout& layout)
    : script_(script), layout_(layout), remaining_(script.frames_before_eos) {}

  bool getNextFrame(cv::Mat& frame, FrameMetadata& metadata) override {
    if (remaining_ <= 0) return false;
    remaining_--;
    frame = cv::Mat(layout_.captureSize(), CV_8UC3, cv::Scalar(50, 60, 70));
    metadata.frameID = script_.reads++;
    metadata.sourceIndex = metadata.frameID;
    metadata.systemTime = std::chrono::steady_clock::now();
    return true;
  }
  bool isOpen() const override { return script_.open; }
  bool reopen() override {
    script_.reopens++;
    script_.open = script_.reopen_succeeds;
    if (script_.open) remaining_ = script_.frames_before_eos;
    return script_.open;
  }
  float getFrameRate() const override { return 15.0f; }
  int getWidth() const override { return layout_.original_width; }
  int getHeight() const override { return layout_.original_height; }
  void close() override { script_.open = false; }

private:
  SourceScript& script_;
  CropLayout layout_;
  int remaining_;
};

} // namespace

TEST(FrameReader, QueuesStampedPairs)
{
  CropLayout layout;
  SourceScript script;
  BoundedQueue<FramePair> queue(4);
  PipelineStats stats;
  FrameReader reader(std::make_unique<FakeSource>(script, layout), layout, queue, stats);

  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);

  FramePair pair;
  ASSERT_EQ(queue.pop_front(pair, 10ms), QueueResult::OK);
  EXPECT_GT(pair.sim_time, 1600000000000LL);
  EXPECT_EQ(pair.primary.size(), cv::Size(layout.frame_width, layout.frame_height));
  EXPECT_EQ(pair.code.size(), cv::Size(layout.code_size, layout.code_size));
  // Timestamp box is drawn on the primary view only
  EXPECT_NE(pair.primary.at<cv::Vec3b>(30, 12), cv::Vec3b(50, 60, 70));
  EXPECT_EQ(pair.code.at<cv::Vec3b>(0, 0), cv::Vec3b(50, 60, 70));
  EXPECT_EQ(stats.frames_read.load(), 1u);
}

TEST(FrameReader, EndOfStreamRestartsDecoder)
{
  CropLayout layout;
  SourceScript script;
  script.frames_before_eos = 2;
  BoundedQueue<FramePair> queue(8);
  PipelineStats stats;
  FrameReader reader(std::make_unique<FakeSource>(script, layout), layout, queue, stats);

  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::RESTARTED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);

  EXPECT_EQ(script.reopens, 1);
  EXPECT_EQ(stats.decoder_restarts.load(), 1u);
  EXPECT_EQ(stats.frames_read.load(), 3u);
}

TEST(FrameReader, FailedRestartIsRetriedOnNextRead)
{
  CropLayout layout;
  SourceScript script;
  script.frames_before_eos = 0;
  script.reopen_succeeds = false;
  BoundedQueue<FramePair> queue(2);
  PipelineStats stats;
  FrameReader reader(std::make_unique<FakeSource>(script, layout), layout, queue, stats);

  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::RESTART_FAILED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::RESTART_FAILED);

  script.reopen_succeeds = true;
  script.frames_before_eos = 1;
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::RESTARTED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);
  EXPECT_EQ(stats.decoder_restarts.load(), 3u);
}

TEST(FrameReader, FullQueueDropsFrames)
{
  CropLayout layout;
  SourceScript script;
  script.frames_before_eos = 10;
  BoundedQueue<FramePair> queue(2);
  PipelineStats stats;
  FrameReader reader(std::make_unique<FakeSource>(script, layout), layout, queue, stats);
  reader.setEnqueueTimeout(5ms);

  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::QUEUED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::DROPPED);
  EXPECT_EQ(reader.readOne(), FrameReader::ReadOutcome::DROPPED);

  EXPECT_EQ(queue.size(), 2u);
  EXPECT_EQ(stats.frames_read.load(), 2u);
  EXPECT_EQ(stats.frames_dropped.load(), 2u);
}

TEST(FrameReader, RunStopsAndClosesSource)
{
  CropLayout layout;
  SourceScript script;
  script.frames_before_eos = 1000;
  BoundedQueue<FramePair> queue(1);
  PipelineStats stats;
  FrameReader reader(std::make_unique<FakeSource>(script, layout), layout, queue, stats);
  reader.setEnqueueTimeout(5ms);

  std::atomic<bool> stop(true);
  reader.run(stop);
  EXPECT_FALSE(script.open);
  EXPECT_EQ(stats.frames_read.load(), 0u);
}

TEST(FrameReader, RunKeepsRetryingAFailedRestart)
{
  CropLayout layout;
  SourceScript script;
  script.frames_before_eos = 0;
  script.reopen_succeeds = false;
  BoundedQueue<FramePair> queue(2);
  PipelineStats stats;
  FrameReader reader(std::make_unique<FakeSource>(script, layout), layout, queue, stats);
  reader.setRetryDelay(5ms);

  std::atomic<bool> stop(false);
  std::thread worker([&] { reader.run(stop); });
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (stats.decoder_restarts.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  stop = true;
  worker.join();

  EXPECT_GE(stats.decoder_restarts.load(), 3u);
  EXPECT_EQ(stats.frames_read.load(), 0u);
  EXPECT_FALSE(script.open);
}
