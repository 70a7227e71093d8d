#ifndef CODE_EXTRACTOR_H
#define CODE_EXTRACTOR_H

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "ICodeDecoder.h"
#include "FrameLayout.h"
#include "CodePayload.h"
#include "LiveFrameSlot.h"
#include "BoundedQueue.hpp"
#include "PipelineStats.h"

// Second stage: looks for an optical code in every code view, queues any
// payload for dispatch and publishes every primary view to the live slot.
class CodeExtractor {
public:
  CodeExtractor(std::unique_ptr<ICodeDecoder> decoder,
                BoundedQueue<FramePair>& decode_queue,
                BoundedQueue<CodePayload>& event_queue,
                LiveFrameSlot& live_slot,
                PipelineStats& stats,
                bool verbose = false);

  void run(std::atomic<bool>& stop);

  // Decode, queue and publish one pair. Returns true when a code was found.
  bool process(FramePair pair);

  void setEnqueueTimeout(std::chrono::milliseconds timeout) { enqueue_timeout_ = timeout; }
  void setLogInterval(uint64_t frames) { log_interval_ = frames ? frames : 1; }

private:
  std::unique_ptr<ICodeDecoder> decoder_;
  BoundedQueue<FramePair>& decode_queue_;
  BoundedQueue<CodePayload>& event_queue_;
  LiveFrameSlot& live_slot_;
  PipelineStats& stats_;
  bool verbose_;

  std::chrono::milliseconds enqueue_timeout_{500};
  std::chrono::milliseconds dequeue_timeout_{1000};
  uint64_t log_interval_ = 100;

  // Rolling window for the periodic report
  uint64_t frame_counter_ = 0;
  std::vector<double> decode_times_ms_;
  double last_publish_ms_ = 0.0;
  double last_loop_ms_ = 0.0;

  void reportWindow();
};

#endif // CODE_EXTRACTOR_H
