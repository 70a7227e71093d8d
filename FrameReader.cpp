#include "FrameReader.h"
#include "SimClock.h"

#include <iostream>
#include <thread>

FrameReader::FrameReader(std::unique_ptr<IFrameSource> source,
                         const CropLayout& layout,
                         BoundedQueue<FramePair>& decode_queue,
                         PipelineStats& stats,
                         bool verbose)
  : source_(std::move(source)),
    layout_(layout),
    decode_queue_(decode_queue),
    stats_(stats),
    verbose_(verbose),
    grab_fps_("GRAB")
{
}

bool FrameReader::restartSource()
{
  stats_.decoder_restarts++;
  if (source_->reopen()) {
    return true;
  }
  std::cerr << "FrameReader: decoder restart failed, retrying" << std::endl;
  return false;
}

FrameReader::ReadOutcome FrameReader::readOne()
{
  if (!source_->isOpen()) {
    return restartSource() ? ReadOutcome::RESTARTED : ReadOutcome::RESTART_FAILED;
  }

  cv::Mat frame;
  FrameMetadata metadata;
  if (!source_->getNextFrame(frame, metadata)) {
    std::cerr << "FrameReader: End of stream or read error, restarting..." << std::endl;
    return restartSource() ? ReadOutcome::RESTARTED : ReadOutcome::RESTART_FAILED;
  }

  int64_t sim_time = currentTimestampMs();
  drawTimestamp(frame, formatTimestamp(sim_time));

  FramePair pair = splitFrame(frame, sim_time, layout_, metadata.frameID);

  if (decode_queue_.push_back(std::move(pair), enqueue_timeout_) != QueueResult::OK) {
    uint64_t dropped = ++stats_.frames_dropped;
    if (verbose_ || dropped == 1 || dropped % 100 == 0) {
      std::cerr << "FrameReader: Decode queue full, dropping frame ("
                << dropped << " dropped)" << std::endl;
    }
    return ReadOutcome::DROPPED;
  }

  stats_.frames_read++;
  grab_fps_.tick();
  return ReadOutcome::QUEUED;
}

void FrameReader::run(std::atomic<bool>& stop)
{
  std::cout << "FrameReader: starting at " << source_->getFrameRate() << " fps, capture "
            << layout_.original_width << "x" << layout_.original_height << std::endl;

  while (!stop) {
    if (readOne() == ReadOutcome::RESTART_FAILED) {
      std::this_thread::sleep_for(retry_delay_);
    }
  }

  source_->close();
  std::cout << "FrameReader: stopped" << std::endl;
}
