#include "ri/protocol/WireFormat.hpp"
#include "ri/protocol/Base64.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace ri {
namespace wire {

std::string keyDown(Keysym keysym) {
  return "kd," + std::to_string(keysym);
}

std::string keyUp(Keysym keysym) {
  return "ku," + std::to_string(keysym);
}

std::string keyboardReset() {
  return "kr";
}

std::string mouse(MouseMode mode, int x, int y, int buttonMask, int extra) {
  std::string s = (mode == MouseMode::Relative) ? "m2," : "m,";
  s += std::to_string(x);
  s += ',';
  s += std::to_string(y);
  s += ',';
  s += std::to_string(buttonMask);
  s += ',';
  s += std::to_string(extra);
  return s;
}

std::string pointerLock(bool locked) {
  return locked ? "p,1" : "p,0";
}

std::string compositionStart() {
  return "co,start";
}

std::string compositionUpdate(const std::string& text) {
  return "co,update," + text;
}

std::string compositionEnd(const std::string& text) {
  return "co,end," + text;
}

std::string gamepadConnect(int index, const std::string& name,
                           int axisCount, int buttonCount) {
  return "js,c," + std::to_string(index) + "," + base64Encode(name) + "," +
         std::to_string(axisCount) + "," + std::to_string(buttonCount);
}

std::string gamepadDisconnect(int index) {
  return "js,d," + std::to_string(index);
}

std::string gamepadButton(int index, int button, double value) {
  return "js,b," + std::to_string(index) + "," + std::to_string(button) + "," +
         formatNumber(value);
}

std::string gamepadAxis(int index, int axis, double value) {
  return "js,a," + std::to_string(index) + "," + std::to_string(axis) + "," +
         formatNumber(value);
}

std::string formatNumber(double value) {
  if (!std::isfinite(value)) return "0";
  if (value == 0.0) return "0";  // also folds -0

  char buf[32];
  for (int precision = 1; precision <= 17; precision++) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
    if (std::strtod(buf, nullptr) == value) break;
  }
  return buf;
}

} // namespace wire
} // namespace ri
