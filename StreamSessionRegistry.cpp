#include "StreamSessionRegistry.h"

#include <iostream>
#include <vector>

StreamSessionRegistry::StreamSessionRegistry(int fps, size_t high_water)
  : next_id_(1),
    frame_duration_ns_(1000000000ULL / static_cast<uint64_t>(fps > 0 ? fps : 1)),
    high_water_(high_water),
    trimmed_(0)
{
}

ClientSession& StreamSessionRegistry::createLocked(SessionId id)
{
  ClientSession& session = sessions_[id];
  session = ClientSession();
  session.id = id;
  session.opened = std::chrono::steady_clock::now();
  return session;
}

SessionId StreamSessionRegistry::openSession(uint64_t* discarded)
{
  std::lock_guard<std::mutex> lock(mutex_);

  SessionId id = next_id_++;
  createLocked(id);

  if (sessions_.size() > high_water_) {
    size_t to_remove = sessions_.size() / 2;
    std::vector<SessionId> victims;
    for (const auto& entry : sessions_) {
      if (victims.size() >= to_remove) break;
      if (entry.first != id) victims.push_back(entry.first);
    }
    for (SessionId victim : victims) {
      sessions_.erase(victim);
      discarded_.insert(victim);
    }
    trimmed_ += victims.size();
    if (discarded) *discarded = victims.size();
    std::cerr << "StreamSessionRegistry: " << victims.size()
              << " stale sessions discarded (" << sessions_.size()
              << " remaining, high water " << high_water_ << ")" << std::endl;
  } else if (discarded) {
    *discarded = 0;
  }
  return id;
}

bool StreamSessionRegistry::closeSession(SessionId id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  discarded_.erase(id);
  return sessions_.erase(id) > 0;
}

StreamTick StreamSessionRegistry::advance(SessionId id, int64_t sim_time)
{
  std::lock_guard<std::mutex> lock(mutex_);

  StreamTick tick;
  tick.session = id;
  tick.duration_ns = frame_duration_ns_;

  ClientSession* session = nullptr;
  auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    session = &it->second;
  } else if (discarded_.erase(id) > 0) {
    session = &createLocked(id);
    tick.revived = true;
  } else {
    return tick;
  }

  tick.tracked = true;
  tick.frame_index = session->frame_count;
  tick.pts_ns = session->frame_count * frame_duration_ns_;

  session->frame_count++;
  session->last_sim_time = sim_time;
  return tick;
}

bool StreamSessionRegistry::getSession(SessionId id, ClientSession& session) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return false;
  session = it->second;
  return true;
}

bool StreamSessionRegistry::contains(SessionId id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(id) > 0;
}

size_t StreamSessionRegistry::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

uint64_t StreamSessionRegistry::trimmed() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return trimmed_;
}
