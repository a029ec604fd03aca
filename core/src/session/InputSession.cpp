#include "ri/session/InputSession.hpp"
#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TaskScheduler.hpp"

#include <cstdio>

namespace ri {

InputSession::InputSession(CommandSink& sink, TaskScheduler& scheduler)
  : encoder_(sink),
    keyboard_(encoder_, scheduler),
    composition_(encoder_, keyboard_, scheduler),
    pointer_(encoder_),
    touch_(pointer_, scheduler),
    wheel_(pointer_, scheduler),
    gamepads_(encoder_),
    caps_(&defaultCaps_) {
  setConfig(config_);
}

InputSession::~InputSession() = default;

void InputSession::setConfig(const InputConfig& cfg) {
  config_ = cfg;
  keyboard_.setQuirks(KeyboardQuirks::forPlatform(config_.platform));
  keyboard_.setRepeatConfig(config_.repeat);
  composition_.setConfig(config_.composition);
  pointer_.setManualResolution(config_.pointer.manualResolution);
  touch_.setConfig(config_.touch);
  wheel_.setConfig(config_.wheel);
  updateCursorScale();
}

void InputSession::setCapabilities(PlatformCapabilities* caps) {
  caps_ = caps ? caps : &defaultCaps_;
}

void InputSession::attach() {
  if (attached_) return;
  attached_ = true;

  // Already fullscreen: capture again.
  if (fullscreen_) {
    captureForFullscreen();
  } else if (pointer_.pointerLocked()) {
    encoder_.pointerLock(true);
  }
}

void InputSession::detach() {
  if (!attached_) return;
  attached_ = false;

  resetKeyboard();
  composition_.cancel();
  touch_.reset();
  wheel_.reset();
  gamepads_.disconnectAll();
  pointer_.releaseButtons();

  if (pointer_.pointerLocked()) {
    caps_->exitPointerLock();
    pointer_.setPointerLocked(false);
  }
  encoder_.pointerLock(false);
}

void InputSession::resize(const SurfaceGeometry& geometry) {
  geometry_ = geometry;
  pointer_.frame().setElementRect(geometry.element);
  pointer_.frame().setCanvasSize(geometry.canvasWidth, geometry.canvasHeight);
  updateCursorScale();
}

void InputSession::updateCursorScale() {
  if (config_.pointer.cursorScaleFactor > 0) {
    pointer_.setCursorScaleFactor(config_.pointer.cursorScaleFactor);
    return;
  }

  int clientW = 0, clientH = 0;
  windowResolution(geometry_.bodyWidth, geometry_.bodyHeight, geometry_.devicePixelRatio,
                   clientW, clientH);
  double factor = 1.0;
  if (computeCursorScaleFactor(config_.pointer.remoteResolution, clientW, clientH,
                               geometry_.canvasWidth, geometry_.canvasHeight, factor)) {
    pointer_.setCursorScaleFactor(factor);
  } else {
    pointer_.clearCursorScaleFactor();
  }
}

bool InputSession::admit(std::uint64_t token) {
  if (!attached_) return false;
  return tokens_.accept(token);
}

bool InputSession::handleHotkey(const RawKeyEvent& e) {
  if (!config_.hotkeysEnabled || fullscreen_) return false;
  if (!e.modifiers.ctrl || !e.modifiers.shift) return false;

  if (e.code == "KeyM" && onMenuHotkey_) {
    onMenuHotkey_();
    return true;
  }
  if (e.code == "KeyF") {
    if (onFullscreenHotkey_) {
      onFullscreenHotkey_();
    } else if (caps_->hasFullscreen() && !caps_->requestFullscreen()) {
      std::fprintf(stderr, "[InputSession] fullscreen request failed\n");
    }
    return true;
  }
  return false;
}

bool InputSession::keyDown(const RawKeyEvent& e) {
  if (composition_.isComposing()) return false;
  if (!admit(e.token)) return false;
  if (handleHotkey(e)) return true;
  return keyboard_.keyDown(e);
}

bool InputSession::keyPress(const RawKeyEvent& e) {
  if (composition_.isComposing()) return false;
  if (!admit(e.token)) return false;
  return keyboard_.keyPress(e);
}

bool InputSession::keyUp(const RawKeyEvent& e) {
  if (composition_.isComposing()) return false;
  if (!admit(e.token)) return false;
  return keyboard_.keyUp(e);
}

bool InputSession::mouse(const MouseEvent& e) {
  if (!admit(e.token)) return false;

  if (e.kind == MouseEventKind::Down && e.button == 0 &&
      e.modifiers.ctrl && e.modifiers.shift && config_.hotkeysEnabled) {
    requestPointerLock();
    return true;
  }

  pointer_.mouseEvent(e);
  return false;
}

bool InputSession::wheel(const WheelEvent& e) {
  if (!admit(e.token)) return false;
  return wheel_.wheel(e.deltaY);
}

bool InputSession::touch(const TouchEvent& e) {
  if (!admit(e.token)) return false;
  return touch_.touch(e);
}

bool InputSession::contextMenu(std::uint64_t token) {
  if (!admit(token)) return false;
  return true;
}

void InputSession::compositionStart(std::uint64_t token) {
  if (!admit(token)) return;
  composition_.start();
}

void InputSession::compositionUpdate(const std::string& data, std::uint64_t token) {
  if (!admit(token)) return;
  composition_.update(data);
}

void InputSession::compositionEnd(const std::string& data, std::uint64_t token) {
  if (!admit(token)) return;
  composition_.end(data);
}

void InputSession::gamepadConnected(int index, const std::string& name,
                                    int axisCount, int buttonCount) {
  if (!attached_) return;
  gamepads_.connect(index, name, axisCount, buttonCount);
}

void InputSession::gamepadDisconnected(int index) {
  if (!attached_) return;
  gamepads_.disconnect(index);
}

void InputSession::gamepadButton(int index, int button, double value) {
  if (!attached_) return;
  gamepads_.button(index, button, value);
}

void InputSession::gamepadAxis(int index, int axis, double value) {
  if (!attached_) return;
  gamepads_.axis(index, axis, value);
}

void InputSession::focusLost() {
  if (!attached_) return;
  resetKeyboard();
}

void InputSession::fullscreenChanged(bool fullscreen) {
  fullscreen_ = fullscreen;
  if (!attached_) return;

  if (fullscreen) {
    captureForFullscreen();
    return;
  }

  if (pointer_.pointerLocked()) caps_->exitPointerLock();
  caps_->releaseKeyboardLock();
  resetKeyboard();
}

void InputSession::pointerLockChanged(bool locked) {
  // Buttons held in one coordinate mode must not leak into the other.
  if (attached_ && locked != pointer_.pointerLocked()) pointer_.releaseButtons();
  pointer_.setPointerLocked(locked);
  if (attached_) encoder_.pointerLock(locked);
}

void InputSession::requestPointerLock() {
  if (pointer_.pointerLocked() || !caps_->hasPointerLock()) return;
  if (!caps_->requestPointerLock())
    std::fprintf(stderr, "[InputSession] pointer lock request failed\n");
}

void InputSession::captureForFullscreen() {
  requestPointerLock();
  if (caps_->hasKeyboardLock() && !caps_->requestKeyboardLock(fullscreenLockedKeys()))
    std::fprintf(stderr, "[InputSession] keyboard lock request failed\n");
}

void InputSession::resetKeyboard() {
  encoder_.keyboardReset();
  keyboard_.reset();
}

} // namespace ri
