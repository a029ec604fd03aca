#pragma once
#include "ri/pointer/PointerEvent.hpp"
#include "ri/sched/TaskScheduler.hpp"

#include <cstddef>
#include <cstdint>
#include <map>

namespace ri {

class PointerMapper;

struct TouchConfig {
  double moveThresholdPx{10};      // pending -> drag promotion distance
  double tapMaxMs{250};
  double tapReleaseDelayMs{20};
  double swipeMaxMs{500};
  double swipeMinDistancePx{50};
  double swipeDominance{2.0};      // |dy| must exceed |dx| by this ratio
  double swipePxPerTick{30};
  int swipeMaxTicks{10};
};

enum class GestureMode : std::uint8_t {
  None = 0,
  PendingSingleTouch,
  SingleTouchDrag,
  TwoFingerGesture
};

struct TouchRecord {
  double startX{0}, startY{0};
  double currentX{0}, currentY{0};
  double startTimeMs{0};
  int lastServerX{0}, lastServerY{0};
};

// Classifies touch contacts into tap, single-finger drag (primary button
// held) and two-finger vertical swipe (wheel). The primary button bit never
// stays set once the last contact is gone, except for the short delayed
// release of a tap.
class TouchMapper {
public:
  TouchMapper(PointerMapper& pointer, TaskScheduler& scheduler);
  ~TouchMapper();

  TouchMapper(const TouchMapper&) = delete;
  TouchMapper& operator=(const TouchMapper&) = delete;

  void setConfig(const TouchConfig& cfg) { config_ = cfg; }
  const TouchConfig& config() const { return config_; }

  // Returns true if the host should suppress the default action.
  bool touch(const TouchEvent& e);

  // Drop every contact and release the primary button.
  void reset();

  GestureMode mode() const { return mode_; }
  std::size_t activeCount() const { return touches_.size(); }
  bool tapReleasePending() const { return tapTask_ != kNoTask; }
  const TouchRecord* record(int id) const;

private:
  void touchStart(const TouchPoint& p, double ts);
  void touchMove(const TouchPoint& p);
  void touchEnd(const TouchPoint& p, double ts, bool cancelled);

  void enterTwoFinger(double ts);
  bool trySwipe(double ts);
  void sendAt(TouchRecord& rec, double clientX, double clientY);
  void tap(TouchRecord& rec);
  void finishTapRelease();
  void releasePrimary();

  PointerMapper& pointer_;
  TaskScheduler& sched_;
  TouchConfig config_;

  std::map<int, TouchRecord> touches_;
  GestureMode mode_{GestureMode::None};
  int dragId_{-1};
  double gestureStartMs_{0};
  bool swipeEligible_{false};
  TaskId tapTask_{kNoTask};
};

} // namespace ri
