#pragma once
#include "ri/sched/TaskScheduler.hpp"

#include <deque>

namespace ri {

class PointerMapper;

struct WheelConfig {
  double throttleMs{100};    // min spacing of scroll commands outside bursts
  int burstWindow{4};        // samples inspected per burst decision
  int burstMinDelta{80};     // |deltaY| counted towards a burst
  int burstRepeatCount{2};   // equal consecutive large samples that make a burst
  int maxTicks{10};          // magnitude clamp
};

// Wheel throttling and adaptive magnitude.
//
// |deltaY| samples fill a window. When it is full it is drained and checked
// for a trackpad burst (repeated equal large deltas): bursts pass through
// unthrottled, anything else is limited to one scroll per throttle window.
class WheelSmoother {
public:
  WheelSmoother(PointerMapper& pointer, TaskScheduler& scheduler);
  ~WheelSmoother();

  WheelSmoother(const WheelSmoother&) = delete;
  WheelSmoother& operator=(const WheelSmoother&) = delete;

  void setConfig(const WheelConfig& cfg) { config_ = cfg; }
  const WheelConfig& config() const { return config_; }

  // Returns true (the host should suppress page scrolling).
  bool wheel(double deltaY);

  void reset();

  bool throttling() const { return allowThreshold_; }
  bool throttleOpen() const { return allowScroll_; }
  int smallestDelta() const { return smallest_; }

private:
  bool drainIsBurst();
  void emit(double deltaY);

  PointerMapper& pointer_;
  TaskScheduler& sched_;
  WheelConfig config_;

  std::deque<int> samples_;
  bool allowThreshold_{true};
  bool allowScroll_{true};
  int smallest_{10000};
  TaskId throttleTask_{kNoTask};
};

} // namespace ri
