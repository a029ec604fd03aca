#pragma once
#include "ri/keyboard/Keysym.hpp"
#include "ri/keyboard/ModifierState.hpp"

#include <cstdint>
#include <string>

namespace ri {

enum class KeyEventKind : std::uint8_t {
  KeyDown = 0, KeyPress, KeyUp
};

// Native keyboard event as delivered by the host surface.
// For KeyPress, keyCode holds the character code.
struct RawKeyEvent {
  KeyEventKind kind{KeyEventKind::KeyDown};
  int keyCode{0};
  std::string key;            // DOM3 key value
  std::string keyIdentifier;  // legacy identifier, e.g. "U+0041"
  std::string code;           // physical key, e.g. "KeyM"
  KeyLocation location{KeyLocation::Standard};
  ModifierState modifiers;
  bool isComposing{false};
  double timestampMs{0};
  std::uint64_t token{0};     // idempotency token, 0 = untracked
};

// Classified event held in the reconciler log.
struct KeyEvent {
  KeyEventKind kind{KeyEventKind::KeyDown};
  int keyCode{0};
  KeyLocation location{KeyLocation::Standard};
  ModifierState modifiers;
  double timestampMs{0};
  Keysym keysym{kNoKeysym};   // best guess
  bool reliable{false};
  bool keyupReliable{true};
};

// Browser/platform misbehaviours the reconciler compensates for.
struct KeyboardQuirks {
  bool keyupUnreliable{false};          // iOS: keyup may never arrive
  bool altIsTypableOnly{false};         // macOS: Alt acts as AltGr
  bool capsLockKeyupUnreliable{false};  // macOS: caps lock only reports toggles

  // Derive from a navigator.platform style string ("MacIntel", "iPhone", ...).
  static KeyboardQuirks forPlatform(const std::string& platform);
};

} // namespace ri
