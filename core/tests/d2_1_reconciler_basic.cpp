// D2.1 - Keyboard reconciler basics
// Tests: keydown+keypress+keyup collapse into one kd/ku pair, keycode-only
// letters honour shift, keydown without keypress uses its own guess,
// unresolvable keyup resets, stray keypress ignored, IME keycode 229 skipped,
// a keypress carrying no character keeps the keydown's keysym.

#include "ri/keyboard/KeyboardReconciler.hpp"
#include "ri/protocol/CommandEncoder.hpp"
#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TimerQueue.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static ri::RawKeyEvent keyEvent(ri::KeyEventKind kind, int keyCode,
                                const std::string& key = "", bool shift = false) {
  ri::RawKeyEvent e;
  e.kind = kind;
  e.keyCode = keyCode;
  e.key = key;
  e.modifiers.shift = shift;
  return e;
}

int main() {
  using namespace ri;
  using K = KeyEventKind;

  // --- Test 1: typed 'a' ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    kb.keyDown(keyEvent(K::KeyDown, 65, "a"));
    requireTrue(log.empty(), "printable keydown waits for keypress");
    requireTrue(kb.pendingEvents() == 1, "keydown buffered");

    bool prevent = kb.keyPress(keyEvent(K::KeyPress, 97));
    requireTrue(prevent, "handled keypress suppresses default");
    requireTrue(log.size() == 1 && log.back() == "kd,97", "kd,97");
    requireTrue(kb.isPressed(0x61), "a held");

    kb.keyUp(keyEvent(K::KeyUp, 65, "a"));
    requireTrue(log.size() == 2 && log.back() == "ku,97", "ku,97");
    requireTrue(kb.pressedCount() == 0, "nothing held");
    requireTrue(kb.pendingEvents() == 0, "log drained");

    std::printf("  Test 1 (kd/ku pair) PASS\n");
  }

  // --- Test 2: keycode-only letter with shift ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    RawKeyEvent shiftDown = keyEvent(K::KeyDown, 16, "Shift", true);
    shiftDown.location = KeyLocation::Left;
    kb.keyDown(shiftDown);
    requireTrue(log.size() == 1 && log.back() == "kd,65505", "shift is reliable");

    kb.keyDown(keyEvent(K::KeyDown, 65, "", true));
    kb.keyUp(keyEvent(K::KeyUp, 65, "", true));
    requireTrue(log.size() == 3, "kd + ku for the letter");
    requireTrue(log.commands()[1] == "kd,65", "keycode 65 with shift -> 'A'");
    requireTrue(log.commands()[2] == "ku,65", "keyup matched via recent keysym");

    RawKeyEvent shiftUp = keyEvent(K::KeyUp, 16, "Shift", false);
    shiftUp.location = KeyLocation::Left;
    kb.keyUp(shiftUp);
    requireTrue(log.back() == "ku,65505", "shift released");

    // Same key unshifted.
    log.clear();
    kb.keyDown(keyEvent(K::KeyDown, 65, "", false));
    kb.keyUp(keyEvent(K::KeyUp, 65, "", false));
    requireTrue(log.size() == 2 && log.commands()[0] == "kd,97" && log.commands()[1] == "ku,97",
                "keycode 65 without shift -> 'a'");

    std::printf("  Test 2 (keycode letter + shift) PASS\n");
  }

  // --- Test 3: non-printable keys act immediately ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    bool prevent = kb.keyDown(keyEvent(K::KeyDown, 13, "Enter"));
    requireTrue(prevent, "Enter handled");
    requireTrue(log.size() == 1 && log.back() == "kd,65293", "kd Return");

    kb.keyUp(keyEvent(K::KeyUp, 13, "Enter"));
    requireTrue(log.back() == "ku,65293", "ku Return");

    kb.keyDown(keyEvent(K::KeyDown, 37));
    requireTrue(log.back() == "kd,65361", "keycode-only arrow");
    kb.keyUp(keyEvent(K::KeyUp, 37));
    requireTrue(log.back() == "ku,65361", "arrow up");

    std::printf("  Test 3 (non-printable) PASS\n");
  }

  // --- Test 4: unresolvable keyup resets held keys ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    kb.keyDown(keyEvent(K::KeyDown, 13, "Enter"));
    kb.keyDown(keyEvent(K::KeyDown, 9, "Tab"));
    requireTrue(kb.pressedCount() == 2, "two held");
    log.clear();

    kb.keyUp(keyEvent(K::KeyUp, 0, "Unidentified"));
    requireTrue(kb.pressedCount() == 0, "all released");
    requireTrue(log.size() == 2, "one ku per held key");
    requireTrue(log.commands()[0] == "ku,65289" && log.commands()[1] == "ku,65293",
                "released in keysym order");
    requireTrue(log.count("kr") == 0, "reconciler reset sends no kr");

    std::printf("  Test 4 (unresolvable keyup) PASS\n");
  }

  // --- Test 5: keyup for a key never pressed, stray keypress, 229 ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    kb.keyUp(keyEvent(K::KeyUp, 13, "Enter"));
    requireTrue(log.empty(), "release of unheld key sends nothing");

    bool prevent = kb.keyPress(keyEvent(K::KeyPress, 97));
    requireTrue(!prevent && log.empty(), "stray keypress ignored");

    prevent = kb.keyDown(keyEvent(K::KeyDown, 229, "Process"));
    requireTrue(!prevent && log.empty() && kb.pendingEvents() == 0, "IME keydown skipped");

    RawKeyEvent composing = keyEvent(K::KeyDown, 65, "a");
    composing.isComposing = true;
    kb.keyDown(composing);
    requireTrue(log.empty() && kb.pendingEvents() == 0, "composing keydown skipped");

    std::printf("  Test 5 (ignored events) PASS\n");
  }

  // --- Test 6: press/release primitives ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    requireTrue(kb.press(0x78), "press x");
    requireTrue(kb.press(0x78), "second press reports held");
    requireTrue(log.size() == 1, "no duplicate kd");
    kb.release(0x78);
    kb.release(0x78);
    requireTrue(log.size() == 2 && log.back() == "ku,120", "single ku");
    requireTrue(!kb.press(kNoKeysym), "no-keysym press refused");

    std::printf("  Test 6 (primitives) PASS\n");
  }

  // --- Test 7: keypress with charCode 0 ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    KeyboardReconciler kb(enc, timers);

    kb.keyDown(keyEvent(K::KeyDown, 65, "a"));
    kb.keyPress(keyEvent(K::KeyPress, 0));
    requireTrue(log.size() == 1 && log.back() == "kd,97", "keydown guess used");
    requireTrue(log.count("kd,65280") == 0, "no keysym for NUL");
    requireTrue(kb.pendingEvents() == 0, "both events consumed");

    kb.keyUp(keyEvent(K::KeyUp, 65, "a"));
    requireTrue(log.size() == 2 && log.back() == "ku,97", "ku,97");

    // Nothing resolvable on either side: the keystroke is dropped quietly.
    kb.keyDown(keyEvent(K::KeyDown, 0, ""));
    kb.keyPress(keyEvent(K::KeyPress, 0));
    requireTrue(log.size() == 2 && kb.pressedCount() == 0, "dropped");

    std::printf("  Test 7 (charCode 0) PASS\n");
  }

  std::printf("D2.1 reconciler_basic: ALL PASS\n");
  return 0;
}
