#pragma once
#include "ri/gamepad/GamepadBridge.hpp"
#include "ri/keyboard/CompositionHandler.hpp"
#include "ri/keyboard/KeyEvent.hpp"
#include "ri/keyboard/KeyboardReconciler.hpp"
#include "ri/pointer/PointerEvent.hpp"
#include "ri/pointer/PointerMapper.hpp"
#include "ri/pointer/TouchMapper.hpp"
#include "ri/pointer/WheelSmoother.hpp"
#include "ri/protocol/CommandEncoder.hpp"
#include "ri/session/EventTokenFilter.hpp"
#include "ri/session/InputConfig.hpp"
#include "ri/session/PlatformCapabilities.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace ri {

class CommandSink;
class TaskScheduler;

// Host surface layout, delivered on attach and on every resize.
struct SurfaceGeometry {
  ElementRect element;            // surface rect in client coordinates
  int canvasWidth{0};             // remote canvas size
  int canvasHeight{0};
  double bodyWidth{0};            // page size in CSS pixels
  double bodyHeight{0};
  double devicePixelRatio{1};
};

// Owns every normalizer and routes host events to them. Events are ignored
// while detached; each event token is processed at most once.
class InputSession {
public:
  InputSession(CommandSink& sink, TaskScheduler& scheduler);
  ~InputSession();

  InputSession(const InputSession&) = delete;
  InputSession& operator=(const InputSession&) = delete;

  void setConfig(const InputConfig& cfg);
  const InputConfig& config() const { return config_; }

  // nullptr restores the no-op capabilities.
  void setCapabilities(PlatformCapabilities* caps);

  void setMenuHotkeyCallback(std::function<void()> cb) { onMenuHotkey_ = std::move(cb); }
  void setFullscreenHotkeyCallback(std::function<void()> cb) { onFullscreenHotkey_ = std::move(cb); }

  void attach();
  // Idempotent. Leaves no key and no button held.
  void detach();
  bool attached() const { return attached_; }

  void resize(const SurfaceGeometry& geometry);
  const SurfaceGeometry& geometry() const { return geometry_; }

  // Entry points return true if the host should suppress the default action.
  bool keyDown(const RawKeyEvent& e);
  bool keyPress(const RawKeyEvent& e);
  bool keyUp(const RawKeyEvent& e);
  bool mouse(const MouseEvent& e);
  bool wheel(const WheelEvent& e);
  bool touch(const TouchEvent& e);
  bool contextMenu(std::uint64_t token = 0);

  void compositionStart(std::uint64_t token = 0);
  void compositionUpdate(const std::string& data, std::uint64_t token = 0);
  void compositionEnd(const std::string& data, std::uint64_t token = 0);

  void gamepadConnected(int index, const std::string& name, int axisCount, int buttonCount);
  void gamepadDisconnected(int index);
  void gamepadButton(int index, int button, double value);
  void gamepadAxis(int index, int axis, double value);

  void focusLost();
  void fullscreenChanged(bool fullscreen);
  void pointerLockChanged(bool locked);

  // kr, then release everything locally.
  void resetKeyboard();

  bool fullscreen() const { return fullscreen_; }

  CommandEncoder& encoder() { return encoder_; }
  KeyboardReconciler& keyboard() { return keyboard_; }
  CompositionHandler& composition() { return composition_; }
  PointerMapper& pointer() { return pointer_; }
  TouchMapper& touchMapper() { return touch_; }
  WheelSmoother& wheelSmoother() { return wheel_; }
  GamepadBridge& gamepads() { return gamepads_; }
  EventTokenFilter& tokens() { return tokens_; }

private:
  bool admit(std::uint64_t token);
  bool handleHotkey(const RawKeyEvent& e);
  void requestPointerLock();
  void captureForFullscreen();
  void updateCursorScale();

  CommandEncoder encoder_;
  KeyboardReconciler keyboard_;
  CompositionHandler composition_;
  PointerMapper pointer_;
  TouchMapper touch_;
  WheelSmoother wheel_;
  GamepadBridge gamepads_;
  EventTokenFilter tokens_;

  PlatformCapabilities defaultCaps_;
  PlatformCapabilities* caps_;

  InputConfig config_;
  SurfaceGeometry geometry_;
  bool attached_{false};
  bool fullscreen_{false};

  std::function<void()> onMenuHotkey_;
  std::function<void()> onFullscreenHotkey_;
};

} // namespace ri
