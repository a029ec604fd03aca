#pragma once
#include "ri/protocol/CommandSink.hpp"
#include "ri/protocol/WireFormat.hpp"

#include <cstdint>
#include <string>

namespace ri {

// Serializes protocol commands and hands them to the sink in call order.
class CommandEncoder {
public:
  explicit CommandEncoder(CommandSink& sink) : sink_(sink) {}

  void keyDown(Keysym keysym)  { emit(wire::keyDown(keysym)); }
  void keyUp(Keysym keysym)    { emit(wire::keyUp(keysym)); }
  void keyboardReset()         { emit(wire::keyboardReset()); }

  void mouse(MouseMode mode, int x, int y, int buttonMask, int extra) {
    emit(wire::mouse(mode, x, y, buttonMask, extra));
  }
  void pointerLock(bool locked) { emit(wire::pointerLock(locked)); }

  void compositionStart()                        { emit(wire::compositionStart()); }
  void compositionUpdate(const std::string& text) { emit(wire::compositionUpdate(text)); }
  void compositionEnd(const std::string& text)    { emit(wire::compositionEnd(text)); }

  void gamepadConnect(int index, const std::string& name, int axes, int buttons) {
    emit(wire::gamepadConnect(index, name, axes, buttons));
  }
  void gamepadDisconnect(int index) { emit(wire::gamepadDisconnect(index)); }
  void gamepadButton(int index, int button, double value) {
    emit(wire::gamepadButton(index, button, value));
  }
  void gamepadAxis(int index, int axis, double value) {
    emit(wire::gamepadAxis(index, axis, value));
  }

  // Total commands emitted through this encoder.
  std::uint64_t sentCount() const { return sent_; }

private:
  void emit(const std::string& command) {
    sent_++;
    sink_.send(command);
  }

  CommandSink& sink_;
  std::uint64_t sent_{0};
};

} // namespace ri
