#include "Simulator.h"

#include <iostream>

#include "VideoFileSource.h"
#include "QrCodeDecoder.h"
#include "CurlHttpClient.h"
#include "FrameReader.h"
#include "CodeExtractor.h"
#include "EventDispatcher.h"
#include "RtspBroadcaster.h"

void runGuarded(const std::string& name, std::atomic<bool>& stop,
                PipelineStats& stats, const std::function<void()>& body)
{
  try {
    body();
  } catch (const std::exception& e) {
    std::cerr << name << ": fatal error: " << e.what()
              << ", stopping simulation" << std::endl;
    stats.errors++;
    stop = true;
  }
}

Simulator::Simulator(const SimulatorConfig& config)
  : config_(config),
    decode_queue_(config.queue_size),
    event_queue_(config.event_queue_size),
    sessions_(config.fps),
    stop_(false),
    stopped_(false),
    last_report_(std::chrono::steady_clock::now())
{
}

Simulator::~Simulator()
{
  stop();
}

void Simulator::start()
{
  std::cout << "Simulator: camera " << config_.camera
            << " (device " << config_.device_id << ")" << std::endl;
  std::cout << "Simulator: video " << config_.video_path << std::endl;
  std::cout << "Simulator: API " << config_.api_url << std::endl;

  // Loops at end of clip; a read that fails after rewinding makes the
  // reader restart the decoder
  auto source = std::make_unique<VideoFileSource>(
      config_.video_path, static_cast<float>(config_.fps),
      config_.layout.original_width, config_.layout.original_height);
  std::cout << "Simulator: clip at " << source->getSourceFrameRate()
            << " fps, resampled to " << config_.fps << " fps" << std::endl;

  reader_ = std::make_unique<FrameReader>(std::move(source), config_.layout,
                                          decode_queue_, stats_, config_.verbose);

  extractor_ = std::make_unique<CodeExtractor>(std::make_unique<QrCodeDecoder>(),
                                               decode_queue_, event_queue_,
                                               live_slot_, stats_, config_.verbose);

  dispatcher_ = std::make_unique<EventDispatcher>(
      config_.api_url, config_.device_id,
      std::make_unique<CurlHttpClient>(config_.http_timeout_ms),
      event_queue_, transaction_, stats_, config_.verbose);

  StreamSettings stream;
  stream.port = config_.rtsp_port;
  stream.mount_path = config_.mount_path;
  stream.fps = config_.fps;
  stream.width = config_.layout.frame_width;
  stream.height = config_.layout.frame_height;
  stream.warmup_frames = config_.warmup_frames;

  broadcaster_ = std::make_unique<RtspBroadcaster>(stream, live_slot_, sessions_,
                                                   stats_, config_.verbose);
  broadcaster_->init();

  std::cout << "Simulator: transaction " << transaction_.current() << std::endl;

  threads_.emplace_back([this] {
    runGuarded("FrameReader", stop_, stats_, [this] { reader_->run(stop_); });
  });
  threads_.emplace_back([this] {
    runGuarded("CodeExtractor", stop_, stats_, [this] { extractor_->run(stop_); });
  });
  threads_.emplace_back([this] {
    runGuarded("EventDispatcher", stop_, stats_, [this] { dispatcher_->run(stop_); });
  });
  threads_.emplace_back([this] {
    runGuarded("RtspBroadcaster", stop_, stats_, [this] { broadcaster_->run(stop_); });
  });

  last_report_ = std::chrono::steady_clock::now();
  std::cout << "Simulator: started" << std::endl;
}

void Simulator::stop()
{
  if (stopped_) return;
  stopped_ = true;

  stop_ = true;
  if (!threads_.empty()) {
    std::cout << "Simulator: stopping" << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.grace_period_ms));
  }

  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();

  std::cout << "Simulator: final " << stats_.summary()
            << " transaction_rotations=" << transaction_.rotations() << std::endl;
}

void Simulator::reportIfDue()
{
  if (config_.stats_interval <= 0) return;

  auto now = std::chrono::steady_clock::now();
  if (now - last_report_ < std::chrono::seconds(config_.stats_interval)) return;
  last_report_ = now;

  std::cout << "Simulator: " << stats_.summary()
            << " decode_queue=" << decode_queue_.size()
            << " event_queue=" << event_queue_.size()
            << " clients=" << sessions_.size() << std::endl;
}
