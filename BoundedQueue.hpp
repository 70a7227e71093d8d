#ifndef BOUNDED_QUEUE_HPP
#define BOUNDED_QUEUE_HPP

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>

enum class QueueResult {
  OK,
  FULL,       // producer waited its full timeout, item dropped
  EMPTY       // consumer waited its full timeout, nothing to take
};

// Fixed capacity FIFO shared between exactly one producer and one consumer.
// Both ends wait at most the given timeout; a full queue never grows.
template <typename T>
class BoundedQueue {
private:
  std::deque<T> queue_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t capacity_;

public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  template <typename Rep, typename Period>
  QueueResult push_back(T item, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_full_.wait_for(lock, timeout,
                            [this] { return queue_.size() < capacity_; })) {
      return QueueResult::FULL;
    }
    queue_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return QueueResult::OK;
  }

  template <typename Rep, typename Period>
  QueueResult pop_front(T& item, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return QueueResult::EMPTY;
    }
    item = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return QueueResult::OK;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

  void clear() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.clear();
    }
    not_full_.notify_all();
  }
};

#endif // BOUNDED_QUEUE_HPP
