// D5.2 - Input session
// Tests: detached events ignored, attach/detach cleanup, duplicate event
// tokens, composition suppresses key events, hotkeys, fullscreen capture,
// pointer lock transitions, focus loss, cursor scale from geometry, facilities
// the host lacks are never requested, detach drops connected gamepads.

#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TimerQueue.hpp"
#include "ri/session/InputSession.hpp"
#include "ri/session/PlatformCapabilities.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Grants every request and reports lock changes back like a browser would.
class RecordingCaps : public ri::PlatformCapabilities {
public:
  explicit RecordingCaps(ri::InputSession& s) : session(s) {}

  bool hasPointerLock() const override { return true; }
  bool hasKeyboardLock() const override { return true; }
  bool hasFullscreen() const override { return true; }

  bool requestPointerLock() override {
    pointerLockRequests++;
    session.pointerLockChanged(true);
    return true;
  }
  void exitPointerLock() override {
    pointerLockExits++;
    session.pointerLockChanged(false);
  }
  bool requestKeyboardLock(const std::vector<std::string>& codes) override {
    lockedCodes = codes;
    return true;
  }
  void releaseKeyboardLock() override { keyboardLockReleases++; }
  bool requestFullscreen() override {
    fullscreenRequests++;
    return true;
  }

  ri::InputSession& session;
  int pointerLockRequests{0};
  int pointerLockExits{0};
  int keyboardLockReleases{0};
  int fullscreenRequests{0};
  std::vector<std::string> lockedCodes;
};

// Offers pointer lock only, and every request is refused.
class RefusingCaps : public ri::PlatformCapabilities {
public:
  bool hasPointerLock() const override { return true; }
  bool requestPointerLock() override {
    pointerLockRequests++;
    return false;
  }
  bool requestKeyboardLock(const std::vector<std::string>& codes) override {
    (void)codes;
    keyboardLockRequests++;
    return false;
  }
  bool requestFullscreen() override {
    fullscreenRequests++;
    return false;
  }

  int pointerLockRequests{0};
  int keyboardLockRequests{0};
  int fullscreenRequests{0};
};

static ri::RawKeyEvent key(ri::KeyEventKind kind, int keyCode, const std::string& k,
                           std::uint64_t token = 0) {
  ri::RawKeyEvent e;
  e.kind = kind;
  e.keyCode = keyCode;
  e.key = k;
  e.token = token;
  return e;
}

static void identityGeometry(ri::InputSession& s) {
  ri::SurfaceGeometry g;
  g.element = {0, 0, 800, 600};
  g.canvasWidth = 800;
  g.canvasHeight = 600;
  g.bodyWidth = 800;
  g.bodyHeight = 600;
  s.resize(g);
}

int main() {
  using namespace ri;
  using K = KeyEventKind;

  // --- Test 1: detached session ignores input ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);

    requireTrue(!s.keyDown(key(K::KeyDown, 13, "Enter")), "not handled");
    MouseEvent m;
    s.mouse(m);
    s.gamepadConnected(0, "Pad", 2, 2);
    requireTrue(log.empty(), "nothing sent while detached");

    s.detach();
    requireTrue(log.empty(), "detach when detached is a no-op");

    std::printf("  Test 1 (detached) PASS\n");
  }

  // --- Test 2: typing and detach cleanup ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    identityGeometry(s);
    s.attach();
    requireTrue(s.attached() && log.empty(), "attach sends nothing when unlocked");

    s.keyDown(key(K::KeyDown, 65, "a"));
    s.keyPress(key(K::KeyPress, 97, ""));
    s.keyUp(key(K::KeyUp, 65, "a"));
    requireTrue(log.size() == 2 && log.commands()[0] == "kd,97" && log.commands()[1] == "ku,97",
                "kd/ku");

    s.keyDown(key(K::KeyDown, 16, "Shift"));
    MouseEvent down;
    down.kind = MouseEventKind::Down;
    down.clientX = 10;
    down.clientY = 20;
    down.button = 2;
    s.mouse(down);
    requireTrue(log.back() == "m,10,20,4,0", "secondary held");
    log.clear();

    s.detach();
    requireTrue(!s.attached(), "detached");
    requireTrue(log.commands()[0] == "kr", "kr first");
    requireTrue(log.count("ku,65505") == 1, "shift released");
    requireTrue(log.count("m,10,20,0,0") == 1, "buttons released");
    requireTrue(log.back() == "p,0", "pointer lock cleared last");
    requireTrue(s.keyboard().pressedCount() == 0 && s.pointer().buttonMask() == 0, "clean");

    std::size_t n = log.size();
    s.detach();
    requireTrue(log.size() == n, "second detach sends nothing");

    std::printf("  Test 2 (typing + detach) PASS\n");
  }

  // --- Test 3: duplicate tokens and composition ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    s.attach();

    s.keyDown(key(K::KeyDown, 13, "Enter", 41));
    s.keyDown(key(K::KeyDown, 13, "Enter", 41));
    requireTrue(log.count("kd,65293") == 1, "duplicate token processed once");
    s.keyUp(key(K::KeyUp, 13, "Enter", 42));
    log.clear();

    s.compositionStart();
    requireTrue(!s.keyDown(key(K::KeyDown, 9, "Tab")), "keys pass through during IME");
    requireTrue(log.size() == 1 && log.back() == "co,start", "no kd while composing");
    s.compositionEnd("x");
    requireTrue(log.count("co,end,x") == 1 && log.count("kd,120") == 1, "committed");

    std::printf("  Test 3 (tokens + composition) PASS\n");
  }

  // --- Test 4: hotkeys ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    RecordingCaps caps(s);
    s.setCapabilities(&caps);
    s.attach();

    RawKeyEvent f = key(K::KeyDown, 70, "F");
    f.code = "KeyF";
    f.modifiers.ctrl = true;
    f.modifiers.shift = true;
    requireTrue(s.keyDown(f), "fullscreen hotkey handled");
    requireTrue(caps.fullscreenRequests == 1 && log.empty(), "fullscreen requested, no keys");

    int menuCalls = 0;
    s.setMenuHotkeyCallback([&] { menuCalls++; });
    RawKeyEvent m = f;
    m.keyCode = 77;
    m.key = "M";
    m.code = "KeyM";
    requireTrue(s.keyDown(m), "menu hotkey handled");
    requireTrue(menuCalls == 1 && log.empty(), "menu callback");

    InputConfig cfg;
    cfg.hotkeysEnabled = false;
    s.setConfig(cfg);
    s.keyDown(f);
    requireTrue(caps.fullscreenRequests == 1, "disabled hotkeys reach the keyboard");
    requireTrue(log.count("kd,70") == 1, "F typed");

    std::printf("  Test 4 (hotkeys) PASS\n");
  }

  // --- Test 5: fullscreen capture and pointer lock ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    RecordingCaps caps(s);
    s.setCapabilities(&caps);
    identityGeometry(s);
    s.attach();

    s.fullscreenChanged(true);
    requireTrue(s.fullscreen(), "fullscreen");
    requireTrue(caps.pointerLockRequests == 1, "pointer lock requested");
    requireTrue(caps.lockedCodes.size() == 7 && caps.lockedCodes[3] == "Escape",
                "system keys captured");
    requireTrue(log.back() == "p,1", "lock announced");
    requireTrue(s.pointer().mode() == MouseMode::Relative, "relative mode");

    MouseEvent mv;
    mv.movementX = 4;
    mv.movementY = -2;
    s.mouse(mv);
    requireTrue(log.back() == "m2,4,-2,0,0", "relative motion");

    s.fullscreenChanged(false);
    requireTrue(caps.pointerLockExits == 1 && caps.keyboardLockReleases == 1, "captures released");
    requireTrue(log.count("p,0") == 1, "unlock announced");
    requireTrue(log.back() == "kr", "keyboard reset on leaving fullscreen");

    std::printf("  Test 5 (fullscreen) PASS\n");
  }

  // --- Test 6: ctrl+shift+click and lock transitions ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    RecordingCaps caps(s);
    s.setCapabilities(&caps);
    identityGeometry(s);
    s.attach();

    MouseEvent down;
    down.kind = MouseEventKind::Down;
    down.clientX = 5;
    down.clientY = 5;
    down.modifiers.ctrl = true;
    down.modifiers.shift = true;
    requireTrue(s.mouse(down), "click consumed");
    requireTrue(caps.pointerLockRequests == 1, "lock requested");
    requireTrue(log.size() == 1 && log.back() == "p,1", "only the lock notification");

    s.pointerLockChanged(false);
    down.modifiers = ModifierState{};
    s.mouse(down);
    requireTrue(log.back() == "m,5,5,1,0", "absolute press");
    s.pointerLockChanged(true);
    requireTrue(log.commands()[log.size() - 2] == "m,5,5,0,0", "held button released on mode flip");
    requireTrue(log.back() == "p,1", "then lock announced");

    std::printf("  Test 6 (lock transitions) PASS\n");
  }

  // --- Test 7: focus loss and cursor scale ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    s.attach();

    s.keyDown(key(K::KeyDown, 37, "ArrowLeft"));
    log.clear();
    s.focusLost();
    requireTrue(log.size() == 2 && log.commands()[0] == "kr" && log.commands()[1] == "ku,65361",
                "focus loss resets keyboard");

    SurfaceGeometry g;
    g.element = {0, 0, 960, 540};
    g.canvasWidth = 3840;
    g.canvasHeight = 2160;
    g.bodyWidth = 960;
    g.bodyHeight = 540;
    g.devicePixelRatio = 2;
    s.resize(g);
    requireTrue(s.pointer().hasCursorScaleFactor(), "DPI factor");
    requireTrue(std::fabs(s.pointer().cursorScaleFactor() - 2.0) < 1e-9, "factor 2");

    g.canvasWidth = 1920;
    g.canvasHeight = 1080;
    s.resize(g);
    requireTrue(!s.pointer().hasCursorScaleFactor(), "matching resolution: no factor");

    InputConfig cfg;
    cfg.pointer.cursorScaleFactor = 1.5;
    s.setConfig(cfg);
    requireTrue(std::fabs(s.pointer().cursorScaleFactor() - 1.5) < 1e-9, "configured override");

    std::printf("  Test 7 (focus + cursor scale) PASS\n");
  }

  // --- Test 8: missing and refused capabilities ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    identityGeometry(s);
    s.attach();

    // Default capabilities offer nothing: no requests, nothing on the wire.
    RawKeyEvent f = key(K::KeyDown, 70, "F");
    f.code = "KeyF";
    f.modifiers.ctrl = true;
    f.modifiers.shift = true;
    requireTrue(s.keyDown(f), "hotkey still consumed");
    s.fullscreenChanged(true);
    requireTrue(s.fullscreen() && log.empty(), "fullscreen without capture");
    s.fullscreenChanged(false);
    requireTrue(log.size() == 1 && log.back() == "kr", "exit still resets keyboard");

    RefusingCaps refusing;
    s.setCapabilities(&refusing);
    log.clear();

    s.keyDown(f);
    requireTrue(refusing.fullscreenRequests == 0, "fullscreen not offered, not requested");

    s.fullscreenChanged(true);
    requireTrue(refusing.pointerLockRequests == 1, "offered lock requested");
    requireTrue(refusing.keyboardLockRequests == 0, "keyboard lock not offered");
    requireTrue(log.empty() && s.pointer().mode() == MouseMode::Absolute,
                "refused lock leaves absolute mode");

    MouseEvent mv;
    mv.clientX = 30;
    mv.clientY = 40;
    s.mouse(mv);
    requireTrue(log.back() == "m,30,40,0,0", "input continues uncaptured");

    std::printf("  Test 8 (capabilities) PASS\n");
  }

  // --- Test 9: detach drops gamepads ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    s.attach();

    s.gamepadConnected(2, "B", 6, 15);
    s.gamepadConnected(0, "A", 4, 17);
    log.clear();

    s.detach();
    requireTrue(s.gamepads().connectedCount() == 0, "pads forgotten");
    requireTrue(log.count("js,d,0") == 1 && log.count("js,d,2") == 1, "each pad disconnected");
    requireTrue(log.back() == "p,0", "p,0 still last");

    s.detach();
    requireTrue(log.count("js,d,0") == 1, "second detach is a no-op");

    s.attach();
    s.gamepadButton(0, 1, 1);
    requireTrue(log.back() == "p,0", "stale pad input dropped");
    s.gamepadConnected(0, "A", 4, 17);
    requireTrue(log.back() == "js,c,0,QQ==,4,17", "pad announced again");

    std::printf("  Test 9 (detach + gamepads) PASS\n");
  }

  std::printf("D5.2 session: ALL PASS\n");
  return 0;
}
