#ifndef SIMULATOR_H
#define SIMULATOR_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "SimulatorConfig.h"
#include "BoundedQueue.hpp"
#include "FrameLayout.h"
#include "CodePayload.h"
#include "LiveFrameSlot.h"
#include "StreamSessionRegistry.h"
#include "ActiveTransaction.h"
#include "PipelineStats.h"

class FrameReader;
class CodeExtractor;
class EventDispatcher;
class RtspBroadcaster;

// Run one stage body. A std::exception escaping it is logged, counted and
// raises the shared stop flag so the other stages wind down too.
void runGuarded(const std::string& name, std::atomic<bool>& stop,
                PipelineStats& stats, const std::function<void()>& body);

// Owns all shared pipeline state and the four stage threads
class Simulator {
public:
  explicit Simulator(const SimulatorConfig& config);
  ~Simulator();

  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;

  // Build every stage (video open, RTSP bind) then launch the threads.
  // Throws std::runtime_error if a stage cannot be built; no thread is
  // started in that case.
  void start();

  // Raise the stop flag, give the stages the grace period, join them and
  // print the final counters. Safe to call more than once.
  void stop();

  void requestStop() { stop_ = true; }
  bool stopRequested() const { return stop_.load(); }

  // Print the counter summary if stats_interval has elapsed since the last one
  void reportIfDue();

  const PipelineStats& stats() const { return stats_; }
  const SimulatorConfig& config() const { return config_; }

private:
  SimulatorConfig config_;

  BoundedQueue<FramePair> decode_queue_;
  BoundedQueue<CodePayload> event_queue_;
  LiveFrameSlot live_slot_;
  StreamSessionRegistry sessions_;
  ActiveTransaction transaction_;
  PipelineStats stats_;
  std::atomic<bool> stop_;

  std::unique_ptr<FrameReader> reader_;
  std::unique_ptr<CodeExtractor> extractor_;
  std::unique_ptr<EventDispatcher> dispatcher_;
  std::unique_ptr<RtspBroadcaster> broadcaster_;

  std::vector<std::thread> threads_;
  bool stopped_;
  std::chrono::steady_clock::time_point last_report_;
};

#endif // SIMULATOR_H
