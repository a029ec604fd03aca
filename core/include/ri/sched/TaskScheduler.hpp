#pragma once
#include <cstdint>
#include <functional>

namespace ri {

using TaskId = std::uint64_t;

inline constexpr TaskId kNoTask = 0;

// One-shot delayed callbacks. All callbacks run on the thread that drives
// the scheduler, the same context that delivers input events.
class TaskScheduler {
public:
  virtual ~TaskScheduler() = default;

  virtual TaskId schedule(double delayMs, std::function<void()> fn) = 0;

  // No-op for kNoTask, unknown, or already fired ids.
  virtual void cancel(TaskId id) = 0;

  virtual double nowMs() const = 0;
};

// Cancels `id` and resets it to kNoTask.
inline void cancelTask(TaskScheduler& sched, TaskId& id) {
  if (id != kNoTask) {
    sched.cancel(id);
    id = kNoTask;
  }
}

} // namespace ri
