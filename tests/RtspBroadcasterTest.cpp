#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "RtspBroadcaster.h"

namespace {

bool contains(const std::string& text, const std::string& part)
{
  return text.find(part) != std::string::npos;
}

// A client media whose pipeline is a raw appsrc feeding a fakesink, so the
// session wiring runs without an encoder or a network client. The appsrc
// does not raise need-data by itself; the test emits it.
struct ClientMedia {
  GstElement* pipeline;
  GstElement* appsrc;
  GstRTSPMedia* media;

  ClientMedia() : pipeline(nullptr), appsrc(nullptr), media(nullptr) {
    pipeline = gst_parse_launch(
        "appsrc name=source format=time emit-signals=false "
        "caps=video/x-raw,format=BGR,width=64,height=48,framerate=15/1 "
        "! fakesink sync=false", nullptr);
    appsrc = gst_bin_get_by_name(GST_BIN(pipeline), "source");
    media = gst_rtsp_media_new(pipeline);       // takes the pipeline
  }

  ~ClientMedia() {
    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(appsrc);
    g_object_unref(media);
  }

  void play() {
    gst_element_set_state(pipeline, GST_STATE_PLAYING);
  }

  void halt() {
    gst_element_set_state(pipeline, GST_STATE_NULL);
  }

  void needData() {
    g_signal_emit_by_name(appsrc, "need-data", 4096u);
  }

  void unprepared() {
    g_signal_emit_by_name(media, "unprepared");
  }
};

class RtspSessionWiring : public ::testing::Test {
protected:
  RtspSessionWiring() : sessions_(15, 2) {}

  void SetUp() override {
    gst_init(nullptr, nullptr);
    settings_.port = 0;
    settings_.width = 64;
    settings_.height = 48;
    broadcaster_ = std::make_unique<RtspBroadcaster>(settings_, slot_, sessions_, stats_);
    broadcaster_->init();
  }

  StreamSettings settings_;
  LiveFrameSlot slot_;
  StreamSessionRegistry sessions_;
  PipelineStats stats_;
  std::unique_ptr<RtspBroadcaster> broadcaster_;
};

} // namespace

TEST(RtspBroadcaster, LaunchLineFeedsEncoderFromNamedAppsrc)
{
  StreamSettings settings;
  settings.fps = 12;
  settings.width = 320;
  settings.height = 240;

  LiveFrameSlot slot;
  StreamSessionRegistry sessions(settings.fps);
  PipelineStats stats;
  RtspBroadcaster broadcaster(settings, slot, sessions, stats);

  std::string line = broadcaster.launchLine();
  EXPECT_EQ(line.front(), '(');
  EXPECT_EQ(line.back(), ')');
  EXPECT_TRUE(contains(line, "appsrc name=source is-live=true"));
  EXPECT_TRUE(contains(line, "format=BGR,width=320,height=240,framerate=12/1"));
  EXPECT_TRUE(contains(line, "x264enc speed-preset=ultrafast tune=zerolatency"));
  EXPECT_TRUE(contains(line, "rtph264pay config-interval=1 name=pay0 pt=96"));
}

TEST(RtspBroadcaster, WarmupLineEndsInFakesink)
{
  StreamSettings settings;
  LiveFrameSlot slot;
  StreamSessionRegistry sessions(settings.fps);
  PipelineStats stats;
  RtspBroadcaster broadcaster(settings, slot, sessions, stats);

  std::string line = broadcaster.warmupLine();
  EXPECT_TRUE(contains(line, "appsrc name=warmup_src"));
  EXPECT_TRUE(contains(line, "key-int-max=30"));
  EXPECT_TRUE(contains(line, "fakesink"));
  EXPECT_FALSE(contains(line, "rtph264pay"));
}

TEST(RtspBroadcaster, UrlUsesPortAndMount)
{
  StreamSettings settings;
  settings.port = 8600;
  settings.mount_path = "/cam1";
  LiveFrameSlot slot;
  StreamSessionRegistry sessions(settings.fps);
  PipelineStats stats;
  RtspBroadcaster broadcaster(settings, slot, sessions, stats);

  EXPECT_EQ(broadcaster.url(), "rtsp://0.0.0.0:8600/cam1");
}

TEST(RtspBroadcaster, RunBeforeInitThrows)
{
  StreamSettings settings;
  LiveFrameSlot slot;
  StreamSessionRegistry sessions(settings.fps);
  PipelineStats stats;
  RtspBroadcaster broadcaster(settings, slot, sessions, stats);

  std::atomic<bool> stop(false);
  EXPECT_THROW(broadcaster.run(stop), std::runtime_error);
}

TEST(RtspBroadcaster, WarmupFrameIsBlankUntilPublishedThenLive)
{
  StreamSettings settings;
  settings.width = 64;
  settings.height = 48;
  LiveFrameSlot slot;
  StreamSessionRegistry sessions(settings.fps);
  PipelineStats stats;
  RtspBroadcaster broadcaster(settings, slot, sessions, stats);

  cv::Mat before = broadcaster.warmupFrame();
  EXPECT_EQ(before.size(), cv::Size(64, 48));
  EXPECT_EQ(cv::countNonZero(before.reshape(1)), 0);

  cv::Mat published(48, 64, CV_8UC3, cv::Scalar(40, 80, 120));
  slot.publish(published, 1000);
  EXPECT_EQ(cv::norm(broadcaster.warmupFrame(), published, cv::NORM_INF), 0.0);

  // frames of another size are scaled to the stream
  slot.publish(cv::Mat(96, 128, CV_8UC3, cv::Scalar(7, 7, 7)), 2000);
  cv::Mat scaled = broadcaster.warmupFrame();
  EXPECT_EQ(scaled.size(), cv::Size(64, 48));
  EXPECT_EQ(scaled.at<cv::Vec3b>(10, 10), cv::Vec3b(7, 7, 7));

  // nothing ticks a session clock
  EXPECT_EQ(sessions.size(), 0u);
}

TEST_F(RtspSessionWiring, BindsToAnEphemeralPort)
{
  EXPECT_GT(broadcaster_->boundPort(), 0);
  ASSERT_NE(broadcaster_->mediaFactory(), nullptr);
  EXPECT_FALSE(gst_rtsp_media_factory_is_shared(broadcaster_->mediaFactory()));
}

TEST_F(RtspSessionWiring, MediaConfigureNeedDataUnpreparedLifecycle)
{
  ClientMedia client;
  g_signal_emit_by_name(broadcaster_->mediaFactory(), "media-configure", client.media);

  EXPECT_EQ(stats_.sessions_opened.load(), 1u);
  EXPECT_EQ(sessions_.size(), 1u);

  client.play();
  slot_.publish(cv::Mat(48, 64, CV_8UC3, cv::Scalar(1, 2, 3)), 500);
  client.needData();
  client.needData();
  client.needData();

  EXPECT_EQ(stats_.frames_streamed.load(), 3u);
  EXPECT_EQ(stats_.errors.load(), 0u);

  client.unprepared();
  EXPECT_EQ(stats_.sessions_closed.load(), 1u);
  EXPECT_EQ(sessions_.size(), 0u);

  // a late need-data neither re-creates the session nor streams
  client.needData();
  EXPECT_EQ(sessions_.size(), 0u);
  EXPECT_EQ(stats_.frames_streamed.load(), 3u);
  EXPECT_EQ(stats_.sessions_opened.load(), 1u);
}

TEST_F(RtspSessionWiring, FlushingSourceIsNotCountedAsStreamed)
{
  ClientMedia client;
  broadcaster_->openSession(client.media);

  // a stopped appsrc reports FLUSHING on push-buffer
  client.play();
  client.halt();
  client.needData();
  EXPECT_EQ(stats_.frames_streamed.load(), 0u);
  EXPECT_EQ(sessions_.size(), 1u);
  EXPECT_EQ(stats_.errors.load(), 0u);
}

TEST_F(RtspSessionWiring, DiscardedSessionsCountAsClosed)
{
  // valve at 2 sessions
  std::vector<std::unique_ptr<ClientMedia>> clients;
  for (int i = 0; i < 3; i++) {
    clients.push_back(std::make_unique<ClientMedia>());
    broadcaster_->openSession(clients.back()->media);
  }
  EXPECT_EQ(stats_.sessions_opened.load(), 3u);
  EXPECT_EQ(stats_.sessions_closed.load(), 1u);
  EXPECT_EQ(sessions_.size(), 2u);

  // the oldest client comes back on its next tick
  clients[0]->needData();
  EXPECT_EQ(stats_.sessions_opened.load(), 4u);
  EXPECT_EQ(sessions_.size(), 3u);

  for (auto& client : clients) client->unprepared();
  EXPECT_EQ(sessions_.size(), 0u);
  EXPECT_EQ(stats_.sessions_opened.load() - stats_.sessions_closed.load(), 0u);
}
