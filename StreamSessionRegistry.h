#ifndef STREAM_SESSION_REGISTRY_H
#define STREAM_SESSION_REGISTRY_H

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>

typedef uint64_t SessionId;

// Per-client stream state
struct ClientSession {
  SessionId id = 0;
  uint64_t frame_count = 0;                  // frames served so far
  std::optional<int64_t> last_sim_time;      // timestamp of the last frame served
  std::chrono::steady_clock::time_point opened;
};

// Local timing of one served frame
struct StreamTick {
  SessionId session = 0;
  uint64_t frame_index = 0;
  uint64_t pts_ns = 0;
  uint64_t duration_ns = 0;
  bool tracked = false;      // false for a closed or unknown session
  bool revived = false;      // a discarded session was re-created for this tick
};

// Owns every client session. The streaming engine only keeps session ids
// and calls back into the registry.
class StreamSessionRegistry {
private:
  std::map<SessionId, ClientSession> sessions_;   // ordered oldest first
  mutable std::mutex mutex_;
  SessionId next_id_;
  uint64_t frame_duration_ns_;
  size_t high_water_;
  uint64_t trimmed_;
  std::set<SessionId> discarded_;                 // trimmed and not yet closed

  ClientSession& createLocked(SessionId id);

public:
  explicit StreamSessionRegistry(int fps, size_t high_water = 100);

  // New session with its counter at 0. When more than `high_water`
  // sessions are tracked afterwards, the oldest half (never the new one)
  // is discarded and their number stored in `discarded`.
  SessionId openSession(uint64_t* discarded = nullptr);

  // Returns false when the id was not tracked. A discarded id is
  // forgotten too, but still returns false.
  bool closeSession(SessionId id);

  // Timing for the session's next frame, then advance its counter. A
  // discarded id is re-created at 0 and the tick marked `revived`; a
  // closed or unknown id gets an untracked tick at 0.
  StreamTick advance(SessionId id, int64_t sim_time);

  bool getSession(SessionId id, ClientSession& session) const;
  bool contains(SessionId id) const;

  size_t size() const;
  uint64_t frameDurationNs() const { return frame_duration_ns_; }
  size_t highWater() const { return high_water_; }
  uint64_t trimmed() const;
};

#endif // STREAM_SESSION_REGISTRY_H
