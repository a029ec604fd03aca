#pragma once
#include "ri/keyboard/Keysym.hpp"

#include <cstdint>
#include <string>

namespace ri {

// Coordinate mode of a mouse command.
enum class MouseMode : std::uint8_t {
  Absolute = 0,  // "m"
  Relative       // "m2"
};

// Canonical serialization of each wire command. Pure, never fails.
namespace wire {

std::string keyDown(Keysym keysym);                  // kd,<keysym>
std::string keyUp(Keysym keysym);                    // ku,<keysym>
std::string keyboardReset();                         // kr
std::string mouse(MouseMode mode, int x, int y,
                  int buttonMask, int extra);        // m,.. / m2,..
std::string pointerLock(bool locked);                // p,1 / p,0
std::string compositionStart();                      // co,start
std::string compositionUpdate(const std::string& text);
std::string compositionEnd(const std::string& text);
std::string gamepadConnect(int index, const std::string& name,
                           int axisCount, int buttonCount);
std::string gamepadDisconnect(int index);
std::string gamepadButton(int index, int button, double value);
std::string gamepadAxis(int index, int axis, double value);

// Shortest decimal text that reads back to the same double
// ("1", "0.5", "-0.25").
std::string formatNumber(double value);

} // namespace wire
} // namespace ri
