#pragma once
#include "ri/pointer/PointerEvent.hpp"
#include "ri/pointer/PointerFrame.hpp"
#include "ri/protocol/WireFormat.hpp"

namespace ri {

class CommandEncoder;

// Client resolution in device pixels (body size x devicePixelRatio),
// truncated to even values, at least 1.
void windowResolution(double bodyWidth, double bodyHeight, double devicePixelRatio,
                      int& outWidth, int& outHeight);

// DPI compensation for relative motion. Returns false (no factor) when
// remote resolution is on, either size is empty, or client and server
// resolutions differ by at most 10px on both axes.
bool computeCursorScaleFactor(bool remoteResolution,
                              int clientWidth, int clientHeight,
                              int serverWidth, int serverHeight,
                              double& outFactor);

// Owns the button mask and the last sent position. Every mouse event is
// re-sent as one m/m2 command carrying the full mask.
class PointerMapper {
public:
  explicit PointerMapper(CommandEncoder& encoder) : encoder_(encoder) {}

  PointerFrame& frame() { return frame_; }
  const PointerFrame& frame() const { return frame_; }

  void setManualResolution(bool on);
  bool manualResolution() const { return manual_; }

  void setPointerLocked(bool locked) { locked_ = locked; }
  bool pointerLocked() const { return locked_; }
  MouseMode mode() const { return locked_ ? MouseMode::Relative : MouseMode::Absolute; }

  void setCursorScaleFactor(double factor);
  void clearCursorScaleFactor() { hasScale_ = false; scale_ = 1.0; }
  bool hasCursorScaleFactor() const { return hasScale_; }
  double cursorScaleFactor() const { return scale_; }

  // Mouse move/down/up. Sends exactly one command.
  void mouseEvent(const MouseEvent& e);

  // Touch helpers: touches always use absolute coordinates.
  void moveTo(double clientX, double clientY);
  void setButton(int button, bool down);
  void sendState();

  // Press and release a virtual wheel button with `magnitude` in extra.
  void sendWheel(int button, int magnitude);

  // Clear the mask; sends one command if anything was held.
  void releaseButtons();

  int buttonMask() const { return mask_; }
  int x() const { return x_; }
  int y() const { return y_; }

private:
  CommandEncoder& encoder_;
  PointerFrame frame_;

  bool manual_{false};
  bool locked_{false};
  bool hasScale_{false};
  double scale_{1.0};

  int mask_{0};
  int x_{0}, y_{0};
};

} // namespace ri
