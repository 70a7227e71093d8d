#include "RtspBroadcaster.h"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

// Attached to each client's media; owns nothing but the session id
struct SessionBinding {
  RtspBroadcaster* owner;
  SessionId id;
};

void destroyBinding(gpointer data)
{
  delete static_cast<SessionBinding*>(data);
}

const char* kBindingKey = "rtspsim-session";

std::string capsString(const StreamSettings& s)
{
  std::ostringstream caps;
  caps << "video/x-raw,format=BGR,width=" << s.width
       << ",height=" << s.height
       << ",framerate=" << s.fps << "/1";
  return caps.str();
}

std::string encoderString()
{
  return "x264enc speed-preset=ultrafast tune=zerolatency bitrate=2000 key-int-max=30";
}

} // namespace

RtspBroadcaster::RtspBroadcaster(const StreamSettings& settings,
                                 LiveFrameSlot& live_slot,
                                 StreamSessionRegistry& sessions,
                                 PipelineStats& stats,
                                 bool verbose)
  : settings_(settings),
    sessions_(sessions),
    stats_(stats),
    verbose_(verbose),
    frame_server_(live_slot, sessions, settings.width, settings.height),
    context_(nullptr),
    loop_(nullptr),
    server_(nullptr),
    factory_(nullptr),
    attach_id_(0),
    stop_(nullptr),
    encode_fps_("ENCODE")
{
}

RtspBroadcaster::~RtspBroadcaster()
{
  shutdown();
}

std::string RtspBroadcaster::launchLine() const
{
  std::ostringstream line;
  line << "( appsrc name=source is-live=true block=true format=time"
       << " caps=" << capsString(settings_)
       << " ! videoconvert ! video/x-raw,format=I420"
       << " ! " << encoderString()
       << " ! rtph264pay config-interval=1 name=pay0 pt=96 )";
  return line.str();
}

std::string RtspBroadcaster::warmupLine() const
{
  std::ostringstream line;
  line << "appsrc name=warmup_src is-live=true format=time"
       << " caps=" << capsString(settings_)
       << " ! videoconvert ! video/x-raw,format=I420"
       << " ! " << encoderString()
       << " ! fakesink sync=false";
  return line.str();
}

std::string RtspBroadcaster::url() const
{
  return "rtsp://0.0.0.0:" + std::to_string(settings_.port) + settings_.mount_path;
}

void RtspBroadcaster::init()
{
  GError* error = nullptr;
  if (!gst_init_check(nullptr, nullptr, &error)) {
    std::string msg = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    throw std::runtime_error("GStreamer init failed: " + msg);
  }

  context_ = g_main_context_new();
  loop_ = g_main_loop_new(context_, FALSE);

  server_ = gst_rtsp_server_new();
  std::string service = std::to_string(settings_.port);
  gst_rtsp_server_set_service(server_, service.c_str());
  g_signal_connect(server_, "client-connected",
                   G_CALLBACK(onClientConnected), this);

  factory_ = gst_rtsp_media_factory_new();
  gst_rtsp_media_factory_set_launch(factory_, launchLine().c_str());
  gst_rtsp_media_factory_set_shared(factory_, FALSE);
  g_signal_connect(factory_, "media-configure",
                   G_CALLBACK(onMediaConfigure), this);

  GstRTSPMountPoints* mounts = gst_rtsp_server_get_mount_points(server_);
  // mount points take their own reference to the factory
  gst_rtsp_mount_points_add_factory(mounts, settings_.mount_path.c_str(),
                                    GST_RTSP_MEDIA_FACTORY(g_object_ref(factory_)));
  g_object_unref(mounts);

  attach_id_ = gst_rtsp_server_attach(server_, context_);
  if (attach_id_ == 0) {
    shutdown();
    throw std::runtime_error("RtspBroadcaster: cannot bind port " + service);
  }

  std::cout << "RtspBroadcaster: serving " << url() << " on port " << boundPort()
            << ", session valve at " << sessions_.highWater() << std::endl;
}

int RtspBroadcaster::boundPort() const
{
  return server_ ? gst_rtsp_server_get_bound_port(server_) : -1;
}

cv::Mat RtspBroadcaster::warmupFrame() const
{
  cv::Mat frame = frame_server_.currentFrame();
  if (frame.cols != settings_.width || frame.rows != settings_.height) {
    cv::resize(frame, frame, cv::Size(settings_.width, settings_.height));
  }
  return frame;
}

bool RtspBroadcaster::pushFrame(GstElement* appsrc, const cv::Mat& frame,
                                uint64_t pts, uint64_t duration, uint64_t offset,
                                GstFlowReturn* ret)
{
  cv::Mat contiguous = frame.isContinuous() ? frame : frame.clone();
  gsize size = contiguous.total() * contiguous.elemSize();

  GstBuffer* buffer = gst_buffer_new_allocate(nullptr, size, nullptr);
  if (!buffer) return false;
  gst_buffer_fill(buffer, 0, contiguous.data, size);

  GST_BUFFER_PTS(buffer) = pts;
  GST_BUFFER_DTS(buffer) = pts;
  GST_BUFFER_DURATION(buffer) = duration;
  GST_BUFFER_OFFSET(buffer) = offset;

  g_signal_emit_by_name(appsrc, "push-buffer", buffer, ret);
  gst_buffer_unref(buffer);
  return true;
}

bool RtspBroadcaster::warmup()
{
  if (settings_.warmup_frames <= 0) return true;

  GError* error = nullptr;
  GstElement* pipeline = gst_parse_launch(warmupLine().c_str(), &error);
  if (!pipeline) {
    std::cerr << "RtspBroadcaster: warmup pipeline failed: "
              << (error ? error->message : "unknown") << std::endl;
    if (error) g_error_free(error);
    return false;
  }
  if (error) {
    // recoverable parse warning
    g_error_free(error);
  }

  GstElement* appsrc = gst_bin_get_by_name(GST_BIN(pipeline), "warmup_src");
  if (!appsrc) {
    std::cerr << "RtspBroadcaster: warmup source missing" << std::endl;
    gst_object_unref(pipeline);
    return false;
  }

  bool ok = true;
  if (gst_element_set_state(pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
    std::cerr << "RtspBroadcaster: warmup pipeline would not start" << std::endl;
    ok = false;
  }

  uint64_t duration = sessions_.frameDurationNs();
  for (int i = 0; ok && i < settings_.warmup_frames; i++) {
    cv::Mat frame = warmupFrame();
    GstFlowReturn ret = GST_FLOW_OK;
    if (!pushFrame(appsrc, frame, i * duration, duration, i, &ret) || ret != GST_FLOW_OK) {
      std::cerr << "RtspBroadcaster: warmup push failed at frame " << i << std::endl;
      ok = false;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  GstFlowReturn eos_ret = GST_FLOW_OK;
  g_signal_emit_by_name(appsrc, "end-of-stream", &eos_ret);

  gst_element_set_state(pipeline, GST_STATE_NULL);
  gst_object_unref(appsrc);
  gst_object_unref(pipeline);

  if (ok) {
    std::cout << "RtspBroadcaster: encoder warmed up with "
              << settings_.warmup_frames << " frames" << std::endl;
  }
  return ok;
}

void RtspBroadcaster::run(std::atomic<bool>& stop)
{
  if (!loop_) {
    throw std::runtime_error("RtspBroadcaster: run() before init()");
  }
  stop_ = &stop;

  warmup();

  g_main_context_push_thread_default(context_);

  GSource* poll = g_timeout_source_new(500);
  g_source_set_callback(poll, onStopPoll, this, nullptr);
  g_source_attach(poll, context_);

  if (!stop.load()) {
    g_main_loop_run(loop_);
  }

  g_source_destroy(poll);
  g_source_unref(poll);
  g_main_context_pop_thread_default(context_);

  if (server_) {
    GList* kept = gst_rtsp_server_client_filter(server_, disconnectClient, nullptr);
    g_list_free_full(kept, g_object_unref);
  }
  std::cout << "RtspBroadcaster: stopped" << std::endl;
}

void RtspBroadcaster::shutdown()
{
  if (attach_id_ != 0 && context_) {
    GSource* source = g_main_context_find_source_by_id(context_, attach_id_);
    if (source) g_source_destroy(source);
    attach_id_ = 0;
  }
  if (factory_) {
    g_object_unref(factory_);
    factory_ = nullptr;
  }
  if (server_) {
    g_object_unref(server_);
    server_ = nullptr;
  }
  if (loop_) {
    g_main_loop_unref(loop_);
    loop_ = nullptr;
  }
  if (context_) {
    g_main_context_unref(context_);
    context_ = nullptr;
  }
}

void RtspBroadcaster::openSession(GstRTSPMedia* media)
{
  GstElement* element = gst_rtsp_media_get_element(media);
  GstElement* appsrc = gst_bin_get_by_name_recurse_up(GST_BIN(element), "source");
  gst_object_unref(element);
  if (!appsrc) {
    std::cerr << "RtspBroadcaster: media has no appsrc" << std::endl;
    stats_.errors++;
    return;
  }

  uint64_t discarded = 0;
  SessionBinding* binding = new SessionBinding{this, sessions_.openSession(&discarded)};
  stats_.sessions_opened++;
  stats_.sessions_closed += discarded;

  // the media owns the binding; both signals only borrow it
  g_object_set_data_full(G_OBJECT(media), kBindingKey, binding, destroyBinding);
  g_signal_connect(appsrc, "need-data", G_CALLBACK(onNeedData), binding);
  g_signal_connect(media, "unprepared", G_CALLBACK(onMediaUnprepared), binding);

  if (verbose_) {
    std::cout << "RtspBroadcaster: session " << binding->id << " opened" << std::endl;
  }
  gst_object_unref(appsrc);
}

void RtspBroadcaster::closeSession(SessionId id)
{
  if (sessions_.closeSession(id)) {
    stats_.sessions_closed++;
  }
  if (verbose_) {
    std::cout << "RtspBroadcaster: session " << id << " closed" << std::endl;
  }
}

void RtspBroadcaster::serveTick(GstElement* appsrc, SessionId id)
{
  ServedFrame served = frame_server_.next(id);
  if (!served.tick.tracked) {
    // need-data racing the media's teardown
    return;
  }
  if (served.tick.revived) {
    stats_.sessions_opened++;
  }

  cv::Mat frame = served.frame;
  if (frame.cols != settings_.width || frame.rows != settings_.height) {
    cv::resize(frame, frame, cv::Size(settings_.width, settings_.height));
  }

  GstFlowReturn ret = GST_FLOW_OK;
  if (!pushFrame(appsrc, frame, served.tick.pts_ns, served.tick.duration_ns,
                 served.tick.frame_index, &ret)) {
    std::cerr << "RtspBroadcaster: buffer allocation failed" << std::endl;
    stats_.errors++;
    return;
  }

  if (ret == GST_FLOW_OK) {
    stats_.frames_streamed++;
    std::lock_guard<std::mutex> lock(fps_mutex_);
    encode_fps_.tick();
  } else if (ret != GST_FLOW_FLUSHING) {
    std::cerr << "RtspBroadcaster: push-buffer returned "
              << gst_flow_get_name(ret) << " for session " << id << std::endl;
  }
}

void RtspBroadcaster::onMediaConfigure(GstRTSPMediaFactory* /*factory*/,
                                       GstRTSPMedia* media, gpointer user_data)
{
  RtspBroadcaster* self = static_cast<RtspBroadcaster*>(user_data);
  try {
    self->openSession(media);
  } catch (const std::exception& e) {
    std::cerr << "RtspBroadcaster: media-configure: " << e.what() << std::endl;
    self->stats_.errors++;
  }
}

void RtspBroadcaster::onNeedData(GstElement* appsrc, guint /*length*/,
                                 gpointer user_data)
{
  SessionBinding* binding = static_cast<SessionBinding*>(user_data);
  try {
    binding->owner->serveTick(appsrc, binding->id);
  } catch (const std::exception& e) {
    std::cerr << "RtspBroadcaster: need-data: " << e.what() << std::endl;
    binding->owner->stats_.errors++;
  }
}

void RtspBroadcaster::onMediaUnprepared(GstRTSPMedia* /*media*/, gpointer user_data)
{
  SessionBinding* binding = static_cast<SessionBinding*>(user_data);
  binding->owner->closeSession(binding->id);
}

void RtspBroadcaster::onClientConnected(GstRTSPServer* /*server*/,
                                        GstRTSPClient* client,
                                        gpointer /*user_data*/)
{
  GstRTSPConnection* connection = gst_rtsp_client_get_connection(client);
  const gchar* ip = connection ? gst_rtsp_connection_get_ip(connection) : nullptr;
  std::cout << "RtspBroadcaster: client connected from "
            << (ip ? ip : "unknown") << std::endl;
}

gboolean RtspBroadcaster::onStopPoll(gpointer user_data)
{
  RtspBroadcaster* self = static_cast<RtspBroadcaster*>(user_data);
  if (self->stop_ && self->stop_->load()) {
    g_main_loop_quit(self->loop_);
    return G_SOURCE_REMOVE;
  }
  return G_SOURCE_CONTINUE;
}

GstRTSPFilterResult RtspBroadcaster::disconnectClient(GstRTSPServer* /*server*/,
                                                      GstRTSPClient* /*client*/,
                                                      gpointer /*user_data*/)
{
  return GST_RTSP_FILTER_REMOVE;
}
