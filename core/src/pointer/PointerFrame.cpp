#include "ri/pointer/PointerFrame.hpp"
#include <algorithm>
#include <cmath>

namespace ri {

void PointerFrame::setElementRect(const ElementRect& rect) {
  rect_ = rect;
  recompute();
}

void PointerFrame::setCanvasSize(int width, int height) {
  canvasW_ = width;
  canvasH_ = height;
  recompute();
}

void PointerFrame::setFitMode(FitMode mode) {
  mode_ = mode;
  recompute();
}

void PointerFrame::recompute() {
  valid_ = rect_.width > 0 && rect_.height > 0 && canvasW_ > 0 && canvasH_ > 0;
  multiX_ = multiY_ = 1.0;
  offsetX_ = offsetY_ = 0.0;
  if (!valid_) return;

  double cw = static_cast<double>(canvasW_);
  double ch = static_cast<double>(canvasH_);

  if (mode_ == FitMode::Stretch) {
    multiX_ = cw / rect_.width;
    multiY_ = ch / rect_.height;
    return;
  }

  double multi = std::min(rect_.width / cw, rect_.height / ch);
  double vpW = cw * multi;
  double vpH = ch * multi;
  offsetX_ = (rect_.width - vpW) / 2.0;
  offsetY_ = (rect_.height - vpH) / 2.0;
  multiX_ = vpW > 0 ? cw / vpW : 1.0;
  multiY_ = vpH > 0 ? ch / vpH : 1.0;
}

int PointerFrame::toServerX(double clientX) const {
  if (!valid_) return 0;
  double sx = std::round((clientX - rect_.left - offsetX_) * multiX_);
  return static_cast<int>(std::max(0.0, std::min(static_cast<double>(canvasW_), sx)));
}

int PointerFrame::toServerY(double clientY) const {
  if (!valid_) return 0;
  double sy = std::round((clientY - rect_.top - offsetY_) * multiY_);
  return static_cast<int>(std::max(0.0, std::min(static_cast<double>(canvasH_), sy)));
}

} // namespace ri
