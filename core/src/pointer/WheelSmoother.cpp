#include "ri/pointer/WheelSmoother.hpp"
#include "ri/pointer/PointerMapper.hpp"

#include <algorithm>
#include <cmath>

namespace ri {

static constexpr int kWheelUpButton = 4;
static constexpr int kWheelDownButton = 3;
static constexpr int kSmallestReset = 10000;

WheelSmoother::WheelSmoother(PointerMapper& pointer, TaskScheduler& scheduler)
  : pointer_(pointer), sched_(scheduler) {}

WheelSmoother::~WheelSmoother() {
  cancelTask(sched_, throttleTask_);
}

bool WheelSmoother::drainIsBurst() {
  int count = 0;
  int prev = samples_.front();
  samples_.pop_front();
  while (!samples_.empty()) {
    int next = samples_.front();
    samples_.pop_front();
    if (next >= config_.burstMinDelta && next == prev) count++;
    prev = next;
  }
  return count >= config_.burstRepeatCount;
}

bool WheelSmoother::wheel(double deltaY) {
  int magnitude = static_cast<int>(std::trunc(std::fabs(deltaY)));
  int window = std::max(1, config_.burstWindow);

  if (static_cast<int>(samples_.size()) < window) samples_.push_back(magnitude);
  if (static_cast<int>(samples_.size()) >= window) {
    if (drainIsBurst()) {
      allowThreshold_ = false;
      smallest_ = kSmallestReset;
    } else {
      allowThreshold_ = true;
    }
  }

  if (allowThreshold_ && allowScroll_) {
    allowScroll_ = false;
    emit(deltaY);
    cancelTask(sched_, throttleTask_);
    throttleTask_ = sched_.schedule(config_.throttleMs, [this]() {
      throttleTask_ = kNoTask;
      allowScroll_ = true;
    });
  } else if (!allowThreshold_) {
    emit(deltaY);
  }
  return true;
}

void WheelSmoother::emit(double deltaY) {
  int button = deltaY < 0 ? kWheelUpButton : kWheelDownButton;
  int delta = static_cast<int>(std::fabs(std::trunc(deltaY)));
  if (delta != 0 && delta < smallest_) smallest_ = delta;

  int ticks = std::max(1, delta / smallest_);
  ticks = std::min(ticks, config_.maxTicks);
  pointer_.sendWheel(button, ticks);
}

void WheelSmoother::reset() {
  cancelTask(sched_, throttleTask_);
  samples_.clear();
  allowThreshold_ = true;
  allowScroll_ = true;
  smallest_ = kSmallestReset;
}

} // namespace ri
