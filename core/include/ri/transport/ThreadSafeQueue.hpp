#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>

namespace ri {

// Bounded MPSC queue. When full, the oldest item is dropped.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 1024)
      : maxCap_(maxCapacity) {}

  // Returns false if an older item had to be dropped to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool dropped = false;
    if (maxCap_ > 0 && queue_.size() >= maxCap_) {
      queue_.pop();
      dropped_++;
      dropped = true;
    }
    queue_.push(std::move(item));
    return !dropped;
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  std::uint64_t droppedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    while (!queue_.empty()) queue_.pop();
  }

private:
  mutable std::mutex mtx_;
  std::queue<T> queue_;
  std::size_t maxCap_;
  std::uint64_t dropped_{0};
};

} // namespace ri
