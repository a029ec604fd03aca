#pragma once

namespace ri {

// Rectangle of the host surface in client coordinates.
struct ElementRect {
  double left{0}, top{0}, width{0}, height{0};
};

enum class FitMode : unsigned char {
  Letterbox = 0,  // aspect-fit, centered, uniform scale
  Stretch         // independent x/y scale (manual resolution)
};

// Cached client -> remote canvas transform. Recomputed whenever the element
// rect, canvas size or fit mode changes.
class PointerFrame {
public:
  void setElementRect(const ElementRect& rect);
  void setCanvasSize(int width, int height);
  void setFitMode(FitMode mode);

  // False while either rectangle is empty; conversions then yield 0.
  bool valid() const { return valid_; }

  // Rounded and clamped to [0, canvas].
  int toServerX(double clientX) const;
  int toServerY(double clientY) const;

  // Canvas units per client pixel.
  double scaleX() const { return multiX_; }
  double scaleY() const { return multiY_; }
  double offsetX() const { return offsetX_; }
  double offsetY() const { return offsetY_; }

  const ElementRect& elementRect() const { return rect_; }
  int canvasWidth() const { return canvasW_; }
  int canvasHeight() const { return canvasH_; }
  FitMode fitMode() const { return mode_; }

private:
  void recompute();

  ElementRect rect_;
  int canvasW_{0};
  int canvasH_{0};
  FitMode mode_{FitMode::Letterbox};

  bool valid_{false};
  double multiX_{1}, multiY_{1};
  double offsetX_{0}, offsetY_{0};
};

} // namespace ri
