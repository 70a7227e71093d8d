#include "PipelineStats.h"

#include <iostream>
#include <iomanip>
#include <sstream>

std::string PipelineStats::summary() const
{
  std::ostringstream out;
  out << "frames_read=" << frames_read
      << " frames_dropped=" << frames_dropped
      << " decoder_restarts=" << decoder_restarts
      << " frames_processed=" << frames_processed
      << " qr_decoded=" << qr_decoded
      << " events_dropped=" << events_dropped
      << " api_sent=" << api_sent
      << " api_timeouts=" << api_timeouts
      << " api_transport_errors=" << api_transport_errors
      << " api_http_errors=" << api_http_errors
      << " events_malformed=" << events_malformed
      << " events_unknown=" << events_unknown
      << " frames_streamed=" << frames_streamed
      << " sessions=" << (sessions_opened - sessions_closed)
      << " errors=" << errors;
  return out.str();
}

FpsMeter::FpsMeter(const std::string& label, uint64_t report_every)
  : label_(label),
    report_every_(report_every ? report_every : 1),
    count_(0),
    window_start_(std::chrono::steady_clock::now())
{
}

bool FpsMeter::tick()
{
  if (++count_ < report_every_) return false;

  auto now = std::chrono::steady_clock::now();
  double elapsed = std::chrono::duration<double>(now - window_start_).count();
  double fps = elapsed > 0.0 ? count_ / elapsed : 0.0;

  std::ostringstream line;
  line << "[" << label_ << " FPS] " << std::fixed << std::setprecision(2)
       << fps << " fps (" << count_ << " frames in " << elapsed << "s)";
  std::cout << line.str() << std::endl;

  count_ = 0;
  window_start_ = now;
  return true;
}
