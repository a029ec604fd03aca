#pragma once
#include "ri/session/PlatformCapabilities.hpp"

#ifdef RI_HAS_GLFW

#include <array>
#include <cstdint>
#include <string>

struct GLFWwindow;

namespace ri {

class InputSession;

// Native window that feeds GLFW keyboard, mouse, scroll, focus and resize
// callbacks into an InputSession as browser-style raw events, and samples
// GLFW gamepads as the external gamepad sampler. Also provides pointer lock
// and fullscreen to the session.
class GlfwInputSource : public PlatformCapabilities {
public:
  explicit GlfwInputSource(InputSession& session);
  ~GlfwInputSource() override;

  GlfwInputSource(const GlfwInputSource&) = delete;
  GlfwInputSource& operator=(const GlfwInputSource&) = delete;

  bool init(int width, int height, const std::string& title);

  // Remote canvas size; 0 follows the window's framebuffer.
  void setCanvasSize(int width, int height);

  // Pump window events and sample gamepads. Returns false once the window
  // should close.
  bool poll();

  double nowMs() const;

  bool hasPointerLock() const override;
  bool hasKeyboardLock() const override;
  bool hasFullscreen() const override;
  bool requestPointerLock() override;
  void exitPointerLock() override;
  bool requestKeyboardLock(const std::vector<std::string>& codes) override;
  bool requestFullscreen() override;

private:
  static constexpr int kMaxPads = 16;
  static constexpr int kPadButtons = 15;
  static constexpr int kPadAxes = 6;

  struct PadState {
    bool connected{false};
    std::array<float, kPadButtons> buttons{};
    std::array<float, kPadAxes> axes{};
  };

  void emitResize();
  void samplePads();
  void setLocked(bool locked);

  InputSession& session_;
  GLFWwindow* window_{nullptr};
  int canvasW_{0};
  int canvasH_{0};

  std::uint64_t nextToken_{1};
  double lastCursorX_{0};
  double lastCursorY_{0};
  bool locked_{false};
  bool fullscreen_{false};
  int windowedX_{0}, windowedY_{0}, windowedW_{0}, windowedH_{0};

  std::array<PadState, kMaxPads> pads_{};

  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void charCallback(GLFWwindow* w, unsigned int codepoint);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void focusCallback(GLFWwindow* w, int focused);
  static void sizeCallback(GLFWwindow* w, int width, int height);
};

} // namespace ri

#endif // RI_HAS_GLFW
