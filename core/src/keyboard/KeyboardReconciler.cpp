#include "ri/keyboard/KeyboardReconciler.hpp"
#include "ri/protocol/CommandEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace ri {

namespace {

const std::vector<Keysym> kAltKeysyms   = {keysyms::AltL, keysyms::AltR, keysyms::AltGr};
const std::vector<Keysym> kShiftKeysyms = {keysyms::ShiftL, keysyms::ShiftR};
const std::vector<Keysym> kCtrlKeysyms  = {keysyms::CtrlL, keysyms::CtrlR};
const std::vector<Keysym> kMetaKeysyms  = {keysyms::MetaL, keysyms::MetaR};
const std::vector<Keysym> kHyperKeysyms = {keysyms::SuperL, keysyms::SuperR};

bool contains(const std::vector<Keysym>& v, Keysym k) {
  return std::find(v.begin(), v.end(), k) != v.end();
}

constexpr double kMinRepeatStepMs = 1.0;

} // namespace

KeyRepeatConfig clampRepeatConfig(const KeyRepeatConfig& cfg) {
  const KeyRepeatConfig defaults;
  KeyRepeatConfig out = cfg;
  if (!std::isfinite(out.delayMs)) out.delayMs = defaults.delayMs;
  if (!std::isfinite(out.gapMs)) out.gapMs = defaults.gapMs;
  if (!std::isfinite(out.intervalMs)) out.intervalMs = defaults.intervalMs;

  if (out.delayMs < 0.0) out.delayMs = 0.0;
  if (out.gapMs < kMinRepeatStepMs) out.gapMs = kMinRepeatStepMs;
  if (out.intervalMs < out.gapMs + kMinRepeatStepMs) out.intervalMs = out.gapMs + kMinRepeatStepMs;
  return out;
}

KeyboardReconciler::KeyboardReconciler(CommandEncoder& encoder, TaskScheduler& scheduler)
  : encoder_(encoder), sched_(scheduler) {}

KeyboardReconciler::~KeyboardReconciler() {
  for (auto& p : pressed_) cancelRepeat(p.second);
}

// ---- Classification ----

KeyEvent KeyboardReconciler::classifyKeyDown(const RawKeyEvent& e) {
  KeyEvent k;
  k.kind = KeyEventKind::KeyDown;
  k.keyCode = e.keyCode;
  k.location = e.location;
  k.modifiers = e.modifiers;
  k.timestampMs = e.timestampMs;

  ShiftHint hint = e.modifiers.shift ? ShiftHint::Shifted : ShiftHint::Unshifted;
  k.keysym = resolveKeydownKeysym(e.keyCode, e.key, e.keyIdentifier, e.location, hint);

  k.keyupReliable = !quirks_.keyupUnreliable;

  // Non-printable keys are identified exactly by key / keyCode.
  if (k.keysym != kNoKeysym && !isPrintableKeysym(k.keysym)) {
    k.reliable = true;
  }

  // Keys pressed while Meta is held often never see a keyup.
  if (k.modifiers.meta && !isMetaKeysym(k.keysym)) {
    k.keyupReliable = false;
  } else if (k.keysym == keysyms::CapsLock && quirks_.capsLockKeyupUnreliable) {
    k.keyupReliable = false;
  }

  if (quirks_.altIsTypableOnly &&
      (k.keysym == keysyms::AltL || k.keysym == keysyms::AltR)) {
    k.keysym = keysyms::AltGr;
  }

  // Shortcut chords produce no keypress, so the keydown must be acted on.
  const bool ctrlChord = !k.modifiers.alt && k.modifiers.ctrl;
  const bool altChord = !k.modifiers.ctrl && !quirks_.altIsTypableOnly && k.modifiers.alt;
  if (ctrlChord || altChord || k.modifiers.meta || k.modifiers.hyper) {
    k.reliable = true;
  }

  if (k.keysym != kNoKeysym) {
    recentKeysym_[k.keyCode] = k.keysym;
  }
  return k;
}

KeyEvent KeyboardReconciler::classifyKeyPress(const RawKeyEvent& e) const {
  KeyEvent k;
  k.kind = KeyEventKind::KeyPress;
  k.keyCode = e.keyCode;
  k.location = e.location;
  k.modifiers = e.modifiers;
  k.timestampMs = e.timestampMs;
  k.keysym = e.keyCode > 0 ? keysymFromCodepoint(static_cast<std::uint32_t>(e.keyCode))
                           : kNoKeysym;
  k.reliable = true;
  return k;
}

KeyEvent KeyboardReconciler::classifyKeyUp(const RawKeyEvent& e) const {
  KeyEvent k;
  k.kind = KeyEventKind::KeyUp;
  k.keyCode = e.keyCode;
  k.location = e.location;
  k.modifiers = e.modifiers;
  k.timestampMs = e.timestampMs;

  k.keysym = keysymFromKeyIdentifier(e.key, e.location);
  if (k.keysym == kNoKeysym) k.keysym = keysymFromKeyCode(e.keyCode, e.location);

  // The keydown already proved which keysym this physical key produced.
  if (k.keysym == kNoKeysym || !isPressed(k.keysym)) {
    Keysym recent = recentKeysym(e.keyCode);
    if (recent != kNoKeysym) k.keysym = recent;
  }

  k.reliable = true;
  return k;
}

// ---- Entry points ----

bool KeyboardReconciler::keyDown(const RawKeyEvent& e) {
  if (e.isComposing || e.keyCode == 229) return false;
  log_.push_back(classifyKeyDown(e));
  return interpretEvents();
}

bool KeyboardReconciler::keyPress(const RawKeyEvent& e) {
  if (e.keyCode == 229) return false;
  log_.push_back(classifyKeyPress(e));
  return interpretEvents();
}

bool KeyboardReconciler::keyUp(const RawKeyEvent& e) {
  if (e.keyCode == 229) return false;
  log_.push_back(classifyKeyUp(e));
  return interpretEvents();
}

// ---- Interpretation ----

bool KeyboardReconciler::interpretEvents() {
  bool lastPrevent = false;
  bool prevent = false;
  while (interpretNext(prevent)) {
    lastPrevent = prevent;
  }

  // Nothing the user typed is held any more: no keyup will come to clear
  // the modifiers pressed on their behalf.
  if (allPressedImplicit()) {
    reset();
  }
  return lastPrevent;
}

bool KeyboardReconciler::interpretNext(bool& preventDefault) {
  if (log_.empty()) return false;

  const KeyEvent first = log_.front();

  if (first.kind == KeyEventKind::KeyDown) {
    // Meta may be the start of a system shortcut whose keyup never arrives;
    // decide once the next event shows whether Meta is really chorded.
    if (isMetaKeysym(first.keysym)) {
      if (log_.size() == 1) return false;

      const KeyEvent& next = log_[1];
      if (next.keysym != first.keysym) {
        if (!next.modifiers.meta) {
          log_.pop_front();
          preventDefault = false;
          return true;
        }
      } else if (next.kind == KeyEventKind::KeyDown) {
        log_.pop_front();
        preventDefault = false;
        return true;
      }
    }

    Keysym keysym = kNoKeysym;
    if (first.reliable) {
      keysym = first.keysym;
      log_.pop_front();
    } else if (log_.size() > 1 && log_[1].kind == KeyEventKind::KeyPress) {
      // A keypress without a character (charCode 0) leaves the keydown's guess.
      keysym = log_[1].keysym != kNoKeysym ? log_[1].keysym : first.keysym;
      log_.pop_front();
      log_.pop_front();
    } else if (log_.size() > 1) {
      keysym = first.keysym;
      log_.pop_front();
    } else {
      return false;
    }

    syncModifiers(first);

    if (keysym == kNoKeysym) {
      preventDefault = false;
      return true;
    }

    releaseSimulatedAltGr(keysym);
    preventDefault = pressKey(keysym, false);
    recentKeysym_[first.keyCode] = keysym;

    if (!first.keyupReliable) {
      release(keysym);
    }
    return true;
  }

  if (first.kind == KeyEventKind::KeyUp) {
    log_.pop_front();

    if (quirks_.keyupUnreliable) {
      preventDefault = false;
      return true;
    }

    if (first.keysym != kNoKeysym) {
      release(first.keysym);
      recentKeysym_.erase(first.keyCode);
    } else {
      std::fprintf(stderr,
                   "[KeyboardReconciler] unresolvable keyup (keyCode=%d), resetting\n",
                   first.keyCode);
      reset();
    }
    syncModifiers(first);
    preventDefault = true;
    return true;
  }

  // Stray keypress with no keydown in front of it.
  log_.pop_front();
  preventDefault = false;
  return true;
}

// ---- Modifier sync ----

void KeyboardReconciler::syncModifiers(const KeyEvent& e) {
  updateModifier(e.modifiers.alt,   remoteModifiers_.alt,   kAltKeysyms,   e.keysym);
  updateModifier(e.modifiers.shift, remoteModifiers_.shift, kShiftKeysyms, e.keysym);
  updateModifier(e.modifiers.ctrl,  remoteModifiers_.ctrl,  kCtrlKeysyms,  e.keysym);
  updateModifier(e.modifiers.meta,  remoteModifiers_.meta,  kMetaKeysyms,  e.keysym);
  updateModifier(e.modifiers.hyper, remoteModifiers_.hyper, kHyperKeysyms, e.keysym);

  remoteModifiers_ = e.modifiers;
}

void KeyboardReconciler::updateModifier(bool local, bool remote,
                                        const std::vector<Keysym>& modifierKeysyms,
                                        Keysym eventKeysym) {
  // The event's own key is handled by the press/release that follows.
  if (contains(modifierKeysyms, eventKeysym)) return;

  if (remote && !local) {
    for (Keysym k : modifierKeysyms) release(k);
    return;
  }

  if (!remote && local) {
    for (Keysym k : modifierKeysyms) {
      auto it = pressed_.find(k);
      if (it != pressed_.end() && !it->second.implicit) return;
    }
    pressKey(modifierKeysyms[0], true);
  }
}

void KeyboardReconciler::releaseSimulatedAltGr(Keysym keysym) {
  if (!remoteModifiers_.ctrl || !remoteModifiers_.alt) return;

  // Plain letters are never AltGr output.
  if (isLetterKeysym(keysym)) return;

  if (isPrintableKeysym(keysym)) {
    release(keysyms::CtrlL);
    release(keysyms::CtrlR);
    release(keysyms::AltL);
    release(keysyms::AltR);
  }
}

bool KeyboardReconciler::allPressedImplicit() const {
  if (pressed_.empty()) return false;
  for (const auto& p : pressed_) {
    if (!p.second.implicit) return false;
  }
  return true;
}

// ---- Press / release ----

bool KeyboardReconciler::press(Keysym keysym) {
  return pressKey(keysym, false);
}

bool KeyboardReconciler::pressKey(Keysym keysym, bool implicit) {
  if (keysym == kNoKeysym) return false;

  auto it = pressed_.find(keysym);
  if (it != pressed_.end()) {
    if (!implicit) it->second.implicit = false;
    return true;
  }

  // Only the most recently pressed key auto-repeats.
  for (auto& p : pressed_) haltRepeat(p.first, p.second);

  PressedKey key;
  key.implicit = implicit;
  pressed_.emplace(keysym, key);
  encoder_.keyDown(keysym);

  if (!implicit) armRepeat(keysym);
  return true;
}

void KeyboardReconciler::release(Keysym keysym) {
  auto it = pressed_.find(keysym);
  if (it == pressed_.end()) return;

  cancelRepeat(it->second);
  const bool remoteDown = it->second.remoteDown;
  pressed_.erase(it);

  if (remoteDown) encoder_.keyUp(keysym);
}

void KeyboardReconciler::reset() {
  std::vector<Keysym> held = pressedKeysyms();
  for (Keysym k : held) release(k);

  pressed_.clear();
  recentKeysym_.clear();
  log_.clear();
  remoteModifiers_ = ModifierState{};
}

bool KeyboardReconciler::isImplicit(Keysym keysym) const {
  auto it = pressed_.find(keysym);
  return it != pressed_.end() && it->second.implicit;
}

std::vector<Keysym> KeyboardReconciler::pressedKeysyms() const {
  std::vector<Keysym> out;
  out.reserve(pressed_.size());
  for (const auto& p : pressed_) out.push_back(p.first);
  std::sort(out.begin(), out.end());
  return out;
}

Keysym KeyboardReconciler::recentKeysym(int keyCode) const {
  auto it = recentKeysym_.find(keyCode);
  return it != recentKeysym_.end() ? it->second : kNoKeysym;
}

// ---- Key repeat ----
// One task per held key at any time: delay -> pulse (ku) -> gap -> re-press
// (kd) -> pulse ...

void KeyboardReconciler::armRepeat(Keysym keysym) {
  if (!repeat_.enabled || isNoRepeatKeysym(keysym)) return;
  auto it = pressed_.find(keysym);
  if (it == pressed_.end()) return;

  it->second.repeatTask = sched_.schedule(repeat_.delayMs, [this, keysym]() {
    repeatPulse(keysym);
  });
}

void KeyboardReconciler::repeatPulse(Keysym keysym) {
  auto it = pressed_.find(keysym);
  if (it == pressed_.end()) return;

  it->second.repeatTask = kNoTask;
  encoder_.keyUp(keysym);
  it->second.remoteDown = false;

  it->second.repeatTask = sched_.schedule(repeat_.gapMs, [this, keysym]() {
    repeatRepress(keysym);
  });
}

void KeyboardReconciler::repeatRepress(Keysym keysym) {
  auto it = pressed_.find(keysym);
  if (it == pressed_.end()) return;

  it->second.repeatTask = kNoTask;
  encoder_.keyDown(keysym);
  it->second.remoteDown = true;

  it->second.repeatTask = sched_.schedule(repeat_.intervalMs - repeat_.gapMs, [this, keysym]() {
    repeatPulse(keysym);
  });
}

void KeyboardReconciler::cancelRepeat(PressedKey& key) {
  cancelTask(sched_, key.repeatTask);
}

void KeyboardReconciler::haltRepeat(Keysym keysym, PressedKey& key) {
  cancelTask(sched_, key.repeatTask);
  if (!key.remoteDown) {
    // Stopped inside a pulse gap: the key is still held, put it back down.
    encoder_.keyDown(keysym);
    key.remoteDown = true;
  }
}

} // namespace ri
