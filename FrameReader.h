#ifndef FRAME_READER_H
#define FRAME_READER_H

#include <atomic>
#include <chrono>
#include <memory>

#include "IFrameSource.h"
#include "FrameLayout.h"
#include "BoundedQueue.hpp"
#include "PipelineStats.h"

// First pipeline stage: pulls frames from the decoder, stamps them with the
// simulated time, splits them into primary and code views and hands the pair
// to the extractor. Decoder faults are handled here by restarting the
// decoder; they never stop the pipeline.
class FrameReader {
public:
  enum class ReadOutcome {
    QUEUED,
    DROPPED,          // decode queue stayed full for the whole timeout
    RESTARTED,        // end of stream or read error, decoder restarted
    RESTART_FAILED    // decoder could not be reopened yet
  };

  FrameReader(std::unique_ptr<IFrameSource> source,
              const CropLayout& layout,
              BoundedQueue<FramePair>& decode_queue,
              PipelineStats& stats,
              bool verbose = false);

  // Runs until `stop` is set
  void run(std::atomic<bool>& stop);

  // One read/split/enqueue step
  ReadOutcome readOne();

  void setEnqueueTimeout(std::chrono::milliseconds timeout) { enqueue_timeout_ = timeout; }
  void setRetryDelay(std::chrono::milliseconds delay) { retry_delay_ = delay; }

private:
  std::unique_ptr<IFrameSource> source_;
  CropLayout layout_;
  BoundedQueue<FramePair>& decode_queue_;
  PipelineStats& stats_;
  bool verbose_;

  std::chrono::milliseconds enqueue_timeout_{1000};
  std::chrono::milliseconds retry_delay_{1000};
  FpsMeter grab_fps_;

  bool restartSource();
};

#endif // FRAME_READER_H
