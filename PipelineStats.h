#ifndef PIPELINE_STATS_H
#define PIPELINE_STATS_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

// Counters shared by every stage. Owned by the Simulator and handed to the
// stages by reference.
struct PipelineStats {
  std::atomic<uint64_t> frames_read{0};
  std::atomic<uint64_t> frames_dropped{0};
  std::atomic<uint64_t> decoder_restarts{0};

  std::atomic<uint64_t> frames_processed{0};
  std::atomic<uint64_t> qr_decoded{0};
  std::atomic<uint64_t> events_dropped{0};

  std::atomic<uint64_t> api_sent{0};
  std::atomic<uint64_t> api_timeouts{0};
  std::atomic<uint64_t> api_transport_errors{0};
  std::atomic<uint64_t> api_http_errors{0};
  std::atomic<uint64_t> events_malformed{0};
  std::atomic<uint64_t> events_unknown{0};

  std::atomic<uint64_t> frames_streamed{0};
  std::atomic<uint64_t> sessions_opened{0};
  std::atomic<uint64_t> sessions_closed{0};

  std::atomic<uint64_t> errors{0};

  std::string summary() const;
};

// Counts events and reports the achieved rate every `report_every` events.
class FpsMeter {
private:
  std::string label_;
  uint64_t report_every_;
  uint64_t count_;
  std::chrono::steady_clock::time_point window_start_;

public:
  FpsMeter(const std::string& label, uint64_t report_every = 300);

  // Returns true when a report was printed.
  bool tick();
};

#endif // PIPELINE_STATS_H
