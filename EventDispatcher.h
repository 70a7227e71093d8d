#ifndef EVENT_DISPATCHER_H
#define EVENT_DISPATCHER_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "IHttpClient.h"
#include "CodePayload.h"
#include "EventKind.h"
#include "ActiveTransaction.h"
#include "BoundedQueue.hpp"
#include "PipelineStats.h"

enum class DispatchOutcome {
  SENT,
  TIMEOUT,
  TRANSPORT_ERROR,
  HTTP_ERROR,
  MALFORMED,        // not four fields, or a non-numeric kind code
  UNKNOWN_KIND      // kind code outside 0..7
};

const char* dispatchOutcomeName(DispatchOutcome outcome);

// Third stage: turns queued marker payloads into API calls. Every outcome is
// counted and the dispatcher moves on; nothing is retried.
class EventDispatcher {
public:
  EventDispatcher(const std::string& api_base,
                  const std::string& device_id,
                  std::unique_ptr<IHttpClient> http,
                  BoundedQueue<CodePayload>& event_queue,
                  ActiveTransaction& transaction,
                  PipelineStats& stats,
                  bool verbose = false);

  void run(std::atomic<bool>& stop);

  DispatchOutcome dispatch(const CodePayload& payload);

  // <api_base>/events/<device_id>/<event path>
  std::string eventUrl(EventKind kind) const;

private:
  std::string api_base_;
  std::string device_id_;
  std::unique_ptr<IHttpClient> http_;
  BoundedQueue<CodePayload>& event_queue_;
  ActiveTransaction& transaction_;
  PipelineStats& stats_;
  bool verbose_;

  std::chrono::milliseconds dequeue_timeout_{1000};
};

#endif // EVENT_DISPATCHER_H
