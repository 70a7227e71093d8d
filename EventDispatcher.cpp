#include "EventDispatcher.h"
#include "EventBody.h"

#include <iostream>

const char* dispatchOutcomeName(DispatchOutcome outcome)
{
  switch (outcome) {
  case DispatchOutcome::SENT: return "sent";
  case DispatchOutcome::TIMEOUT: return "timeout";
  case DispatchOutcome::TRANSPORT_ERROR: return "transport_error";
  case DispatchOutcome::HTTP_ERROR: return "http_error";
  case DispatchOutcome::MALFORMED: return "malformed";
  case DispatchOutcome::UNKNOWN_KIND: return "unknown_kind";
  }
  return "unknown";
}

EventDispatcher::EventDispatcher(const std::string& api_base,
                                 const std::string& device_id,
                                 std::unique_ptr<IHttpClient> http,
                                 BoundedQueue<CodePayload>& event_queue,
                                 ActiveTransaction& transaction,
                                 PipelineStats& stats,
                                 bool verbose)
  : api_base_(api_base),
    device_id_(device_id),
    http_(std::move(http)),
    event_queue_(event_queue),
    transaction_(transaction),
    stats_(stats),
    verbose_(verbose)
{
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

std::string EventDispatcher::eventUrl(EventKind kind) const
{
  return api_base_ + "/events/" + device_id_ + "/" + eventPath(kind);
}

DispatchOutcome EventDispatcher::dispatch(const CodePayload& payload)
{
  auto marker = splitMarker(payload.raw);
  long long code = 0;
  if (!marker || !parseInteger(marker->kind_code, code)) {
    stats_.events_malformed++;
    if (verbose_) {
      std::cerr << "EventDispatcher: Invalid QR data format: " << payload.raw << std::endl;
    }
    return DispatchOutcome::MALFORMED;
  }

  auto kind = eventKindFromCode(code);
  if (!kind) {
    stats_.events_unknown++;
    std::cerr << "EventDispatcher: Unknown barcode type: " << marker->kind_code << std::endl;
    return DispatchOutcome::UNKNOWN_KIND;
  }

  long long timestamp = 0;
  if (!parseInteger(marker->timestamp, timestamp)) {
    timestamp = payload.sim_time;
  }

  // A new transaction begins with its own start event
  std::string transaction_id = (*kind == EventKind::TRANSACTION_STARTED) ?
    transaction_.rotate() : transaction_.current();

  EventBase base;
  base.transaction_id = transaction_id;
  base.timestamp = timestamp;
  base.server_timestamp = payload.sim_time;

  EventBody body = buildEventBody(*kind, base);
  std::string url = eventUrl(*kind);

  HttpResult result = http_->postJson(url, serializeEventBody(body));

  switch (result.status) {
  case HttpStatus::OK:
    stats_.api_sent++;
    if (verbose_) {
      std::cout << "EventDispatcher: " << eventKindName(*kind) << " -> " << url
                << " (" << result.code << ")" << std::endl;
    }
    return DispatchOutcome::SENT;
  case HttpStatus::TIMEOUT:
    stats_.api_timeouts++;
    std::cerr << "EventDispatcher: Request timeout: " << url << std::endl;
    return DispatchOutcome::TIMEOUT;
  case HttpStatus::TRANSPORT_ERROR:
    stats_.api_transport_errors++;
    std::cerr << "EventDispatcher: Request error: " << result.error << std::endl;
    return DispatchOutcome::TRANSPORT_ERROR;
  case HttpStatus::HTTP_ERROR:
    stats_.api_http_errors++;
    std::cerr << "EventDispatcher: " << url << " returned " << result.code << std::endl;
    return DispatchOutcome::HTTP_ERROR;
  }
  return DispatchOutcome::TRANSPORT_ERROR;
}

void EventDispatcher::run(std::atomic<bool>& stop)
{
  std::cout << "EventDispatcher: starting: " << api_base_
            << " (device " << device_id_ << ")" << std::endl;

  while (!stop) {
    CodePayload payload;
    if (event_queue_.pop_front(payload, dequeue_timeout_) != QueueResult::OK) {
      continue;
    }
    DispatchOutcome outcome = dispatch(payload);
    if (verbose_) {
      std::cout << "EventDispatcher: " << payload.raw << ": "
                << dispatchOutcomeName(outcome) << std::endl;
    }
  }

  std::cout << "EventDispatcher: stopped" << std::endl;
}
