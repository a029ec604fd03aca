#pragma once
#include "ri/keyboard/KeyEvent.hpp"
#include "ri/keyboard/Keysym.hpp"
#include "ri/keyboard/ModifierState.hpp"
#include "ri/sched/TaskScheduler.hpp"

#include <cstddef>
#include <deque>
#include <unordered_map>
#include <vector>

namespace ri {

class CommandEncoder;

struct KeyRepeatConfig {
  bool enabled{true};
  double delayMs{500};     // hold time before the first repeat
  double intervalMs{50};   // repeat period
  double gapMs{10};        // release -> re-press gap inside one pulse
};

// Forces timings the repeat chain can run on: delay >= 0, gap >= 1 ms and
// interval >= gap + 1 ms. Non-finite values fall back to the defaults.
KeyRepeatConfig clampRepeatConfig(const KeyRepeatConfig& cfg);

// Turns overlapping keydown/keypress/keyup triples into one kd/ku pair per
// logical keystroke, keeps remote modifiers in step with the local ones and
// emulates auto-repeat for held keys.
//
// Events are buffered in a short log. A keydown whose keysym is not reliable
// waits for at most one following event: a keypress supplies the character,
// anything else means the keydown's own guess is used.
class KeyboardReconciler {
public:
  KeyboardReconciler(CommandEncoder& encoder, TaskScheduler& scheduler);
  ~KeyboardReconciler();

  KeyboardReconciler(const KeyboardReconciler&) = delete;
  KeyboardReconciler& operator=(const KeyboardReconciler&) = delete;

  void setQuirks(const KeyboardQuirks& quirks) { quirks_ = quirks; }
  const KeyboardQuirks& quirks() const { return quirks_; }
  void setRepeatConfig(const KeyRepeatConfig& cfg) { repeat_ = clampRepeatConfig(cfg); }
  const KeyRepeatConfig& repeatConfig() const { return repeat_; }

  // Feed one native event. Returns true if the host should suppress the
  // event's default action.
  bool keyDown(const RawKeyEvent& e);
  bool keyPress(const RawKeyEvent& e);
  bool keyUp(const RawKeyEvent& e);

  // Primitive press: sends kd unless already held. Returns true if the key
  // is (now) held with a kd on the wire.
  bool press(Keysym keysym);

  // Primitive release: sends ku if held. Cancels repeat for that key.
  void release(Keysym keysym);

  // Releases every held key and forgets all derived state.
  void reset();

  bool isPressed(Keysym keysym) const { return pressed_.count(keysym) != 0; }
  bool isImplicit(Keysym keysym) const;
  std::size_t pressedCount() const { return pressed_.size(); }
  std::vector<Keysym> pressedKeysyms() const;

  const ModifierState& remoteModifiers() const { return remoteModifiers_; }
  std::size_t pendingEvents() const { return log_.size(); }

  // Keysym recorded for a keycode by its last keydown, or kNoKeysym.
  Keysym recentKeysym(int keyCode) const;

private:
  struct PressedKey {
    bool implicit{false};    // held only to satisfy modifier sync
    bool remoteDown{true};   // false during the gap of a repeat pulse
    TaskId repeatTask{kNoTask};
  };

  KeyEvent classifyKeyDown(const RawKeyEvent& e);
  KeyEvent classifyKeyPress(const RawKeyEvent& e) const;
  KeyEvent classifyKeyUp(const RawKeyEvent& e) const;

  // Drain the log; returns the preventDefault decision of the last
  // interpreted event.
  bool interpretEvents();

  // Interpret the head of the log. Returns false if the head must wait for
  // more events (nothing consumed).
  bool interpretNext(bool& preventDefault);

  bool pressKey(Keysym keysym, bool implicit);

  void syncModifiers(const KeyEvent& e);
  void updateModifier(bool local, bool remote,
                      const std::vector<Keysym>& modifierKeysyms,
                      Keysym eventKeysym);
  void releaseSimulatedAltGr(Keysym keysym);
  bool allPressedImplicit() const;

  void armRepeat(Keysym keysym);
  void repeatPulse(Keysym keysym);
  void repeatRepress(Keysym keysym);
  void cancelRepeat(PressedKey& key);
  void haltRepeat(Keysym keysym, PressedKey& key);

  CommandEncoder& encoder_;
  TaskScheduler& sched_;
  KeyboardQuirks quirks_;
  KeyRepeatConfig repeat_;

  std::deque<KeyEvent> log_;
  ModifierState remoteModifiers_;
  std::unordered_map<Keysym, PressedKey> pressed_;
  std::unordered_map<int, Keysym> recentKeysym_;  // keyCode -> keysym
};

} // namespace ri
