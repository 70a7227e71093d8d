#include "CodeExtractor.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

namespace
{
  double elapsedMs(std::chrono::steady_clock::time_point since)
  {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
  }
}

CodeExtractor::CodeExtractor(std::unique_ptr<ICodeDecoder> decoder,
                             BoundedQueue<FramePair>& decode_queue,
                             BoundedQueue<CodePayload>& event_queue,
                             LiveFrameSlot& live_slot,
                             PipelineStats& stats,
                             bool verbose)
  : decoder_(std::move(decoder)),
    decode_queue_(decode_queue),
    event_queue_(event_queue),
    live_slot_(live_slot),
    stats_(stats),
    verbose_(verbose)
{
}

bool CodeExtractor::process(FramePair pair)
{
  auto loop_start = std::chrono::steady_clock::now();
  bool found = false;

  auto decode_start = std::chrono::steady_clock::now();
  std::string text;
  try {
    found = decoder_->decode(pair.code, text);
  }
  catch (const std::exception& e) {
    found = false;
    if (verbose_) {
      std::cerr << "CodeExtractor: decode exception: " << e.what() << std::endl;
    }
  }
  decode_times_ms_.push_back(elapsedMs(decode_start));

  if (found) {
    stats_.qr_decoded++;
    if (verbose_) {
      std::cout << "CodeExtractor: code at frame " << pair.frame_id << ": " << text << std::endl;
    }

    CodePayload payload = makeCodePayload(text, pair.sim_time, pair.frame_id);
    if (event_queue_.push_back(std::move(payload), enqueue_timeout_) != QueueResult::OK) {
      stats_.events_dropped++;
      std::cerr << "CodeExtractor: Request queue full, dropping code data" << std::endl;
    }
  }

  // Every primary view goes live, code or not
  auto publish_start = std::chrono::steady_clock::now();
  live_slot_.publish(pair.primary, pair.sim_time);
  last_publish_ms_ = elapsedMs(publish_start);

  stats_.frames_processed++;
  last_loop_ms_ = elapsedMs(loop_start);

  if (++frame_counter_ % log_interval_ == 0) {
    reportWindow();
  }
  return found;
}

void CodeExtractor::reportWindow()
{
  double avg = 0.0, lo = 0.0, hi = 0.0;
  if (!decode_times_ms_.empty()) {
    avg = std::accumulate(decode_times_ms_.begin(), decode_times_ms_.end(), 0.0) /
          decode_times_ms_.size();
    auto range = std::minmax_element(decode_times_ms_.begin(), decode_times_ms_.end());
    lo = *range.first;
    hi = *range.second;
  }

  std::ostringstream line;
  line << std::fixed << std::setprecision(1)
       << "CodeExtractor: Stats: DecodeQueue=" << decode_queue_.size()
       << ", EventQueue=" << event_queue_.size()
       << ", Published=" << live_slot_.sequence()
       << ", QR_Time(avg/min/max)=" << avg << "/" << lo << "/" << hi << "ms"
       << ", Publish=" << last_publish_ms_ << "ms"
       << ", Loop=" << last_loop_ms_ << "ms";
  std::cout << line.str() << std::endl;

  decode_times_ms_.clear();
}

void CodeExtractor::run(std::atomic<bool>& stop)
{
  std::cout << "CodeExtractor: starting" << std::endl;

  while (!stop) {
    FramePair pair;
    if (decode_queue_.pop_front(pair, dequeue_timeout_) != QueueResult::OK) {
      if (verbose_ && frame_counter_ > 0) {
        std::cout << "CodeExtractor: decode queue empty, waiting for frames..." << std::endl;
      }
      continue;
    }
    process(std::move(pair));
  }

  std::cout << "CodeExtractor: stopped" << std::endl;
}
