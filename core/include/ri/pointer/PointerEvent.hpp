#pragma once
#include "ri/keyboard/ModifierState.hpp"

#include <cstdint>
#include <vector>

namespace ri {

enum class MouseEventKind : std::uint8_t {
  Move = 0, Down, Up
};

// Generic mouse snapshot. Client coordinates are in host surface pixels,
// movement deltas are only meaningful while the pointer is locked.
struct MouseEvent {
  MouseEventKind kind{MouseEventKind::Move};
  double clientX{0}, clientY{0};
  double movementX{0}, movementY{0};
  int button{0};  // 0 = primary, 1 = middle, 2 = secondary, ...
  ModifierState modifiers;
  std::uint64_t token{0};
};

struct WheelEvent {
  double deltaY{0};  // positive = scroll down
  std::uint64_t token{0};
};

enum class TouchEventKind : std::uint8_t {
  Start = 0, Move, End, Cancel
};

struct TouchPoint {
  int id{0};
  double clientX{0}, clientY{0};
};

// One touch event; `changed` lists the contacts it reports.
struct TouchEvent {
  TouchEventKind kind{TouchEventKind::Start};
  std::vector<TouchPoint> changed;
  double timestampMs{0};
  std::uint64_t token{0};
};

} // namespace ri
