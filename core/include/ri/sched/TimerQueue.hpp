#pragma once
#include "ri/sched/TaskScheduler.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <utility>

namespace ri {

// Deterministic scheduler driven by its owner: a frame loop passes the
// current time to advanceTo(), tests step it with advanceBy().
class TimerQueue : public TaskScheduler {
public:
  explicit TimerQueue(double startMs = 0.0) : now_(startMs) {}

  TaskId schedule(double delayMs, std::function<void()> fn) override;
  void cancel(TaskId id) override;
  double nowMs() const override { return now_; }

  // Fire every task due at or before targetMs, in (due, schedule order).
  // Tasks scheduled by callbacks fire in the same call if already due.
  // Returns the number of callbacks run.
  std::size_t advanceTo(double targetMs);
  std::size_t advanceBy(double deltaMs) { return advanceTo(now_ + deltaMs); }

  std::size_t pending() const { return tasks_.size(); }
  bool isPending(TaskId id) const;

  void clear() { tasks_.clear(); }

private:
  // (due time, sequence) keeps FIFO order among equal due times.
  using Key = std::pair<double, TaskId>;

  double now_;
  TaskId nextId_{1};
  std::map<Key, std::function<void()>> tasks_;
};

} // namespace ri
