#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "LiveFrameSlot.h"

namespace {

// Every pixel carries the low byte of the timestamp it was published with
cv::Mat taggedFrame(int64_t sim_time)
{
  int v = static_cast<int>(sim_time % 256);
  return cv::Mat(48, 64, CV_8UC3, cv::Scalar(v, v, v));
}

} // namespace

TEST(LiveFrameSlot, EmptyUntilFirstPublish)
{
  LiveFrameSlot slot;
  cv::Mat frame;
  int64_t sim_time = -1;
  EXPECT_FALSE(slot.hasFrame());
  EXPECT_FALSE(slot.read(frame, sim_time));
  EXPECT_EQ(slot.sequence(), 0u);

  slot.publish(taggedFrame(3), 3);
  EXPECT_TRUE(slot.read(frame, sim_time));
  EXPECT_EQ(sim_time, 3);
  EXPECT_EQ(slot.sequence(), 1u);
}

TEST(LiveFrameSlot, LatestPublishWins)
{
  LiveFrameSlot slot;
  slot.publish(taggedFrame(1), 1);
  slot.publish(taggedFrame(2), 2);

  cv::Mat frame;
  int64_t sim_time = 0;
  uint64_t seq = 0;
  ASSERT_TRUE(slot.read(frame, sim_time, &seq));
  EXPECT_EQ(sim_time, 2);
  EXPECT_EQ(seq, 2u);
  EXPECT_EQ(frame.at<cv::Vec3b>(0, 0)[0], 2);
}

TEST(LiveFrameSlot, CopyFrameIsIndependent)
{
  LiveFrameSlot slot;
  slot.publish(taggedFrame(9), 9);

  cv::Mat copy;
  int64_t sim_time = 0;
  ASSERT_TRUE(slot.copyFrame(copy, sim_time));
  copy.setTo(cv::Scalar(0, 0, 0));

  cv::Mat current;
  slot.read(current, sim_time);
  EXPECT_EQ(current.at<cv::Vec3b>(0, 0)[0], 9);
}

TEST(LiveFrameSlot, ConcurrentReadersNeverSeeTornFrames)
{
  LiveFrameSlot slot;
  std::atomic<bool> done(false);
  std::atomic<int> torn(0);
  std::atomic<int> reads(0);

  std::thread writer([&] {
    for (int64_t t = 1; t <= 2000; t++) {
      slot.publish(taggedFrame(t), t);
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; r++) {
    readers.emplace_back([&] {
      while (!done) {
        cv::Mat frame;
        int64_t sim_time = 0;
        if (!slot.read(frame, sim_time)) continue;

        int expected = static_cast<int>(sim_time % 256);
        double lo = 0, hi = 0;
        cv::minMaxLoc(frame.reshape(1), &lo, &hi);
        if (lo != expected || hi != expected) torn++;
        reads++;
      }
    });
  }

  writer.join();
  for (auto& t : readers) t.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(slot.sequence(), 2000u);
}
