#include "ri/sched/TimerQueue.hpp"

#include <utility>

namespace ri {

TaskId TimerQueue::schedule(double delayMs, std::function<void()> fn) {
  if (!(delayMs > 0.0)) delayMs = 0.0;  // also catches NaN
  TaskId id = nextId_++;
  tasks_.emplace(Key{now_ + delayMs, id}, std::move(fn));
  return id;
}

void TimerQueue::cancel(TaskId id) {
  if (id == kNoTask) return;
  for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
    if (it->first.second == id) {
      tasks_.erase(it);
      return;
    }
  }
}

bool TimerQueue::isPending(TaskId id) const {
  for (const auto& t : tasks_) {
    if (t.first.second == id) return true;
  }
  return false;
}

std::size_t TimerQueue::advanceTo(double targetMs) {
  std::size_t fired = 0;

  while (!tasks_.empty()) {
    auto it = tasks_.begin();
    if (it->first.first > targetMs) break;

    // Clock reads the task's due time while it runs, so work it schedules
    // is timed relative to when it was meant to fire.
    if (it->first.first > now_) now_ = it->first.first;

    auto fn = std::move(it->second);
    tasks_.erase(it);
    fn();
    fired++;
  }

  if (targetMs > now_) now_ = targetMs;
  return fired;
}

} // namespace ri
