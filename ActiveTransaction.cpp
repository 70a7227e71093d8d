#include "ActiveTransaction.h"

#include <cstdint>
#include <cstdio>
#include <random>

std::string generateUuid()
{
  thread_local std::mt19937_64 gen(std::random_device{}());
  uint64_t hi = gen();
  uint64_t lo = gen();

  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf);
}

ActiveTransaction::ActiveTransaction()
  : id_(generateUuid()), rotations_(0)
{
}

ActiveTransaction::ActiveTransaction(const std::string& initial_id)
  : id_(initial_id), rotations_(0)
{
}

std::string ActiveTransaction::current() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return id_;
}

std::string ActiveTransaction::rotate()
{
  std::string next = generateUuid();
  std::lock_guard<std::mutex> lock(mutex_);
  id_ = next;
  rotations_++;
  return next;
}

unsigned long ActiveTransaction::rotations() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return rotations_;
}
