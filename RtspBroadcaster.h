#ifndef RTSP_BROADCASTER_H
#define RTSP_BROADCASTER_H

#include <atomic>
#include <mutex>
#include <string>

#include <gst/gst.h>
#include <gst/rtsp-server/rtsp-server.h>

#include "FrameServer.h"
#include "LiveFrameSlot.h"
#include "StreamSessionRegistry.h"
#include "PipelineStats.h"

struct StreamSettings {
  int port = 8554;
  std::string mount_path = "/simulation";
  int fps = 15;
  int width = 640;
  int height = 480;
  int warmup_frames = 90;
};

// RTSP endpoint serving the live slot. Every client gets its own media
// pipeline and session; all of them read the same live frame on each tick.
class RtspBroadcaster {
public:
  RtspBroadcaster(const StreamSettings& settings,
                  LiveFrameSlot& live_slot,
                  StreamSessionRegistry& sessions,
                  PipelineStats& stats,
                  bool verbose = false);
  ~RtspBroadcaster();

  RtspBroadcaster(const RtspBroadcaster&) = delete;
  RtspBroadcaster& operator=(const RtspBroadcaster&) = delete;

  // Initialise GStreamer and bind the server socket. Throws
  // std::runtime_error when the engine cannot be brought up.
  void init();

  // Push warmup frames through a throwaway encoder. Failure is logged only.
  bool warmup();

  // Frame fed to the warmup encoder: the live frame if one was published,
  // else black, at the stream size
  cv::Mat warmupFrame() const;

  // Bind a client's media to a new session: its appsrc `need-data` serves
  // frames and its `unprepared` signal closes the session
  void openSession(GstRTSPMedia* media);

  // Warm up, then serve clients until `stop` is set
  void run(std::atomic<bool>& stop);

  std::string launchLine() const;
  std::string warmupLine() const;
  std::string url() const;

  // Valid between init() and destruction
  GstRTSPMediaFactory* mediaFactory() const { return factory_; }
  int boundPort() const;

private:
  StreamSettings settings_;
  StreamSessionRegistry& sessions_;
  PipelineStats& stats_;
  bool verbose_;
  FrameServer frame_server_;

  GMainContext* context_;
  GMainLoop* loop_;
  GstRTSPServer* server_;
  GstRTSPMediaFactory* factory_;
  guint attach_id_;
  std::atomic<bool>* stop_;

  std::mutex fps_mutex_;
  FpsMeter encode_fps_;

  void serveTick(GstElement* appsrc, SessionId id);
  void closeSession(SessionId id);
  void shutdown();

  static bool pushFrame(GstElement* appsrc, const cv::Mat& frame,
                        uint64_t pts, uint64_t duration, uint64_t offset,
                        GstFlowReturn* ret);

  // GLib callbacks
  static void onMediaConfigure(GstRTSPMediaFactory* factory, GstRTSPMedia* media,
                               gpointer user_data);
  static void onNeedData(GstElement* appsrc, guint length, gpointer user_data);
  static void onMediaUnprepared(GstRTSPMedia* media, gpointer user_data);
  static void onClientConnected(GstRTSPServer* server, GstRTSPClient* client,
                                gpointer user_data);
  static gboolean onStopPoll(gpointer user_data);
  static GstRTSPFilterResult disconnectClient(GstRTSPServer* server,
                                              GstRTSPClient* client,
                                              gpointer user_data);
};

#endif // RTSP_BROADCASTER_H
