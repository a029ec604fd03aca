#include "ri/pointer/TouchMapper.hpp"
#include "ri/pointer/PointerMapper.hpp"

#include <algorithm>
#include <cmath>

namespace ri {

static constexpr int kPrimaryButton = 0;
static constexpr int kWheelUpButton = 4;
static constexpr int kWheelDownButton = 3;

TouchMapper::TouchMapper(PointerMapper& pointer, TaskScheduler& scheduler)
  : pointer_(pointer), sched_(scheduler) {}

TouchMapper::~TouchMapper() {
  cancelTask(sched_, tapTask_);
}

const TouchRecord* TouchMapper::record(int id) const {
  auto it = touches_.find(id);
  return it != touches_.end() ? &it->second : nullptr;
}

bool TouchMapper::touch(const TouchEvent& e) {
  for (const auto& p : e.changed) {
    switch (e.kind) {
      case TouchEventKind::Start:  touchStart(p, e.timestampMs); break;
      case TouchEventKind::Move:   touchMove(p); break;
      case TouchEventKind::End:    touchEnd(p, e.timestampMs, false); break;
      case TouchEventKind::Cancel: touchEnd(p, e.timestampMs, true); break;
    }
  }
  return e.kind == TouchEventKind::Start || e.kind == TouchEventKind::Move;
}

void TouchMapper::touchStart(const TouchPoint& p, double ts) {
  // A new contact settles any tap still waiting for its release.
  if (tapTask_ != kNoTask) finishTapRelease();

  TouchRecord rec;
  rec.startX = rec.currentX = p.clientX;
  rec.startY = rec.currentY = p.clientY;
  rec.startTimeMs = ts;
  touches_[p.id] = rec;

  if (touches_.size() == 1) {
    if (mode_ == GestureMode::None) mode_ = GestureMode::PendingSingleTouch;
  } else if (touches_.size() == 2) {
    enterTwoFinger(ts);
  } else {
    // Three or more contacts are ambiguous.
    swipeEligible_ = false;
  }
}

void TouchMapper::enterTwoFinger(double ts) {
  if (mode_ == GestureMode::SingleTouchDrag) releasePrimary();
  dragId_ = -1;
  mode_ = GestureMode::TwoFingerGesture;
  gestureStartMs_ = ts;
  swipeEligible_ = true;
}

void TouchMapper::touchMove(const TouchPoint& p) {
  auto it = touches_.find(p.id);
  if (it == touches_.end()) return;
  TouchRecord& rec = it->second;

  if (mode_ == GestureMode::PendingSingleTouch) {
    rec.currentX = p.clientX;
    rec.currentY = p.clientY;
    double dx = rec.currentX - rec.startX;
    double dy = rec.currentY - rec.startY;
    double t = config_.moveThresholdPx;
    if (dx * dx + dy * dy <= t * t) return;

    mode_ = GestureMode::SingleTouchDrag;
    dragId_ = p.id;
    pointer_.setButton(kPrimaryButton, true);
    sendAt(rec, rec.startX, rec.startY);
    sendAt(rec, rec.currentX, rec.currentY);
  } else if (mode_ == GestureMode::SingleTouchDrag) {
    rec.currentX = p.clientX;
    rec.currentY = p.clientY;
    if (p.id == dragId_) sendAt(rec, rec.currentX, rec.currentY);
  } else {
    rec.currentX = p.clientX;
    rec.currentY = p.clientY;
  }
}

void TouchMapper::touchEnd(const TouchPoint& p, double ts, bool cancelled) {
  auto it = touches_.find(p.id);
  if (it == touches_.end()) return;
  TouchRecord& rec = it->second;
  rec.currentX = p.clientX;
  rec.currentY = p.clientY;

  if (mode_ == GestureMode::TwoFingerGesture) {
    if (!cancelled && trySwipe(ts)) return;
  } else if (mode_ == GestureMode::SingleTouchDrag && p.id == dragId_) {
    pointer_.moveTo(rec.currentX, rec.currentY);
    releasePrimary();
    dragId_ = -1;
    mode_ = GestureMode::None;
  } else if (mode_ == GestureMode::PendingSingleTouch && !cancelled) {
    double dx = rec.currentX - rec.startX;
    double dy = rec.currentY - rec.startY;
    double t = config_.moveThresholdPx;
    if (ts - rec.startTimeMs <= config_.tapMaxMs && dx * dx + dy * dy <= t * t) {
      tap(rec);
    }
    mode_ = GestureMode::None;
  }

  touches_.erase(it);

  if (mode_ == GestureMode::TwoFingerGesture && touches_.size() < 2) {
    mode_ = GestureMode::None;
    swipeEligible_ = false;
  }
  if (touches_.empty()) {
    dragId_ = -1;
    mode_ = GestureMode::None;
    if (tapTask_ == kNoTask && (pointer_.buttonMask() & (1 << kPrimaryButton))) {
      releasePrimary();
    }
  }
}

bool TouchMapper::trySwipe(double ts) {
  if (!swipeEligible_ || touches_.size() != 2) return false;
  if (ts - gestureStartMs_ > config_.swipeMaxMs) return false;

  double dx = 0, dy = 0;
  for (const auto& t : touches_) {
    dx += t.second.currentX - t.second.startX;
    dy += t.second.currentY - t.second.startY;
  }
  dx /= static_cast<double>(touches_.size());
  dy /= static_cast<double>(touches_.size());

  double ady = std::fabs(dy);
  if (ady < config_.swipeMinDistancePx) return false;
  if (ady < std::fabs(dx) * config_.swipeDominance) return false;

  // Fingers moving up scroll the content down.
  int button = dy < 0 ? kWheelDownButton : kWheelUpButton;
  double perTick = config_.swipePxPerTick > 0 ? config_.swipePxPerTick : 1.0;
  int ticks = static_cast<int>(std::floor(ady / perTick));
  ticks = std::max(1, std::min(ticks, config_.swipeMaxTicks));
  pointer_.sendWheel(button, ticks);

  touches_.clear();
  mode_ = GestureMode::None;
  swipeEligible_ = false;
  dragId_ = -1;
  return true;
}

void TouchMapper::sendAt(TouchRecord& rec, double clientX, double clientY) {
  pointer_.moveTo(clientX, clientY);
  rec.lastServerX = pointer_.x();
  rec.lastServerY = pointer_.y();
  pointer_.sendState();
}

void TouchMapper::tap(TouchRecord& rec) {
  pointer_.setButton(kPrimaryButton, true);
  sendAt(rec, rec.startX, rec.startY);
  cancelTask(sched_, tapTask_);
  tapTask_ = sched_.schedule(config_.tapReleaseDelayMs, [this]() {
    tapTask_ = kNoTask;
    releasePrimary();
  });
}

void TouchMapper::finishTapRelease() {
  cancelTask(sched_, tapTask_);
  releasePrimary();
}

void TouchMapper::releasePrimary() {
  pointer_.setButton(kPrimaryButton, false);
  pointer_.sendState();
}

void TouchMapper::reset() {
  cancelTask(sched_, tapTask_);
  touches_.clear();
  mode_ = GestureMode::None;
  dragId_ = -1;
  swipeEligible_ = false;
  if (pointer_.buttonMask() & (1 << kPrimaryButton)) releasePrimary();
}

} // namespace ri
