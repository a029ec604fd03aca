#include "ri/gamepad/GamepadBridge.hpp"
#include "ri/protocol/CommandEncoder.hpp"

#include <cstdio>

namespace ri {

void GamepadBridge::connect(int index, const std::string& name, int axisCount, int buttonCount) {
  if (index < 0) {
    std::fprintf(stderr, "[GamepadBridge] ignoring connect with index %d\n", index);
    return;
  }
  GamepadInfo gp;
  gp.name = name;
  gp.axisCount = axisCount < 0 ? 0 : axisCount;
  gp.buttonCount = buttonCount < 0 ? 0 : buttonCount;
  pads_[index] = gp;
  encoder_.gamepadConnect(index, gp.name, gp.axisCount, gp.buttonCount);
}

void GamepadBridge::disconnect(int index) {
  auto it = pads_.find(index);
  if (it == pads_.end()) return;
  pads_.erase(it);
  encoder_.gamepadDisconnect(index);
}

bool GamepadBridge::button(int index, int button, double value) {
  auto it = pads_.find(index);
  if (it == pads_.end()) {
    std::fprintf(stderr, "[GamepadBridge] button for unknown gamepad %d\n", index);
    return false;
  }
  if (button < 0 || button >= it->second.buttonCount) return false;
  encoder_.gamepadButton(index, button, value);
  return true;
}

bool GamepadBridge::axis(int index, int axis, double value) {
  auto it = pads_.find(index);
  if (it == pads_.end()) {
    std::fprintf(stderr, "[GamepadBridge] axis for unknown gamepad %d\n", index);
    return false;
  }
  if (axis < 0 || axis >= it->second.axisCount) return false;
  encoder_.gamepadAxis(index, axis, value);
  return true;
}

void GamepadBridge::disconnectAll() {
  while (!pads_.empty()) disconnect(pads_.begin()->first);
}

const GamepadInfo* GamepadBridge::info(int index) const {
  auto it = pads_.find(index);
  return it != pads_.end() ? &it->second : nullptr;
}

} // namespace ri
