#include "ri/pointer/PointerMapper.hpp"
#include "ri/protocol/CommandEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ri {

void windowResolution(double bodyWidth, double bodyHeight, double devicePixelRatio,
                      int& outWidth, int& outHeight) {
  double ratio = devicePixelRatio > 0 ? devicePixelRatio : 1.0;
  double w = bodyWidth * ratio;
  double h = bodyHeight * ratio;
  w -= std::fmod(w, 2.0);
  h -= std::fmod(h, 2.0);
  outWidth = std::max(1, static_cast<int>(w));
  outHeight = std::max(1, static_cast<int>(h));
}

bool computeCursorScaleFactor(bool remoteResolution,
                              int clientWidth, int clientHeight,
                              int serverWidth, int serverHeight,
                              double& outFactor) {
  if (remoteResolution) return false;
  if (serverWidth <= 0 || serverHeight <= 0) return false;
  if (clientWidth <= 0 || clientHeight <= 0) return false;
  if (std::abs(clientWidth - serverWidth) <= 10 &&
      std::abs(clientHeight - serverHeight) <= 10) {
    return false;
  }
  outFactor = std::hypot(static_cast<double>(serverWidth), static_cast<double>(serverHeight)) /
              std::hypot(static_cast<double>(clientWidth), static_cast<double>(clientHeight));
  return true;
}

void PointerMapper::setManualResolution(bool on) {
  manual_ = on;
  frame_.setFitMode(on ? FitMode::Stretch : FitMode::Letterbox);
}

void PointerMapper::setCursorScaleFactor(double factor) {
  hasScale_ = factor > 0;
  scale_ = hasScale_ ? factor : 1.0;
}

void PointerMapper::mouseEvent(const MouseEvent& e) {
  if (locked_) {
    if (manual_ && frame_.valid()) {
      x_ = static_cast<int>(std::round(e.movementX * frame_.scaleX()));
      y_ = static_cast<int>(std::round(e.movementY * frame_.scaleY()));
    } else if (!manual_ && hasScale_) {
      x_ = static_cast<int>(std::trunc(e.movementX * scale_));
      y_ = static_cast<int>(std::trunc(e.movementY * scale_));
    } else {
      x_ = static_cast<int>(e.movementX);
      y_ = static_cast<int>(e.movementY);
    }
  } else {
    x_ = frame_.toServerX(e.clientX);
    y_ = frame_.toServerY(e.clientY);
  }

  if (e.kind != MouseEventKind::Move) {
    setButton(e.button, e.kind == MouseEventKind::Down);
  }

  encoder_.mouse(mode(), x_, y_, mask_, 0);
}

void PointerMapper::moveTo(double clientX, double clientY) {
  x_ = frame_.toServerX(clientX);
  y_ = frame_.toServerY(clientY);
}

void PointerMapper::setButton(int button, bool down) {
  if (button < 0 || button > 30) return;
  int bit = 1 << button;
  if (down) mask_ |= bit;
  else mask_ &= ~bit;
}

void PointerMapper::sendState() {
  encoder_.mouse(MouseMode::Absolute, x_, y_, mask_, 0);
}

void PointerMapper::sendWheel(int button, int magnitude) {
  // A locked pointer must not be displaced by a scroll.
  int x = locked_ ? 0 : x_;
  int y = locked_ ? 0 : y_;

  setButton(button, true);
  encoder_.mouse(mode(), x, y, mask_, magnitude);
  setButton(button, false);
  encoder_.mouse(mode(), x, y, mask_, magnitude);
}

void PointerMapper::releaseButtons() {
  if (mask_ == 0) return;
  mask_ = 0;
  if (locked_) encoder_.mouse(MouseMode::Relative, 0, 0, 0, 0);
  else encoder_.mouse(MouseMode::Absolute, x_, y_, 0, 0);
}

} // namespace ri
