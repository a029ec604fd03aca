#ifdef RI_HAS_GLFW

#include "ri/glfw/GlfwInputSource.hpp"
#include "ri/session/InputSession.hpp"

#include <GLFW/glfw3.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace ri {

namespace {

struct GlfwKeyInfo {
  int glfwKey;
  int keyCode;        // legacy DOM keyCode
  const char* key;    // DOM key for non-printable keys, "" otherwise
  const char* code;   // DOM physical code
  KeyLocation location;
};

const GlfwKeyInfo kKeyTable[] = {
  {GLFW_KEY_SPACE,         32,  "",            "Space",        KeyLocation::Standard},
  {GLFW_KEY_APOSTROPHE,    222, "",            "Quote",        KeyLocation::Standard},
  {GLFW_KEY_COMMA,         188, "",            "Comma",        KeyLocation::Standard},
  {GLFW_KEY_MINUS,         189, "",            "Minus",        KeyLocation::Standard},
  {GLFW_KEY_PERIOD,        190, "",            "Period",       KeyLocation::Standard},
  {GLFW_KEY_SLASH,         191, "",            "Slash",        KeyLocation::Standard},
  {GLFW_KEY_SEMICOLON,     186, "",            "Semicolon",    KeyLocation::Standard},
  {GLFW_KEY_EQUAL,         187, "",            "Equal",        KeyLocation::Standard},
  {GLFW_KEY_LEFT_BRACKET,  219, "",            "BracketLeft",  KeyLocation::Standard},
  {GLFW_KEY_BACKSLASH,     220, "",            "Backslash",    KeyLocation::Standard},
  {GLFW_KEY_RIGHT_BRACKET, 221, "",            "BracketRight", KeyLocation::Standard},
  {GLFW_KEY_GRAVE_ACCENT,  192, "",            "Backquote",    KeyLocation::Standard},
  {GLFW_KEY_ESCAPE,        27,  "Escape",      "Escape",       KeyLocation::Standard},
  {GLFW_KEY_ENTER,         13,  "Enter",       "Enter",        KeyLocation::Standard},
  {GLFW_KEY_TAB,           9,   "Tab",         "Tab",          KeyLocation::Standard},
  {GLFW_KEY_BACKSPACE,     8,   "Backspace",   "Backspace",    KeyLocation::Standard},
  {GLFW_KEY_INSERT,        45,  "Insert",      "Insert",       KeyLocation::Standard},
  {GLFW_KEY_DELETE,        46,  "Delete",      "Delete",       KeyLocation::Standard},
  {GLFW_KEY_RIGHT,         39,  "ArrowRight",  "ArrowRight",   KeyLocation::Standard},
  {GLFW_KEY_LEFT,          37,  "ArrowLeft",   "ArrowLeft",    KeyLocation::Standard},
  {GLFW_KEY_DOWN,          40,  "ArrowDown",   "ArrowDown",    KeyLocation::Standard},
  {GLFW_KEY_UP,            38,  "ArrowUp",     "ArrowUp",      KeyLocation::Standard},
  {GLFW_KEY_PAGE_UP,       33,  "PageUp",      "PageUp",       KeyLocation::Standard},
  {GLFW_KEY_PAGE_DOWN,     34,  "PageDown",    "PageDown",     KeyLocation::Standard},
  {GLFW_KEY_HOME,          36,  "Home",        "Home",         KeyLocation::Standard},
  {GLFW_KEY_END,           35,  "End",         "End",          KeyLocation::Standard},
  {GLFW_KEY_CAPS_LOCK,     20,  "CapsLock",    "CapsLock",     KeyLocation::Standard},
  {GLFW_KEY_SCROLL_LOCK,   145, "ScrollLock",  "ScrollLock",   KeyLocation::Standard},
  {GLFW_KEY_NUM_LOCK,      144, "NumLock",     "NumLock",      KeyLocation::Numpad},
  {GLFW_KEY_PRINT_SCREEN,  44,  "PrintScreen", "PrintScreen",  KeyLocation::Standard},
  {GLFW_KEY_PAUSE,         19,  "Pause",       "Pause",        KeyLocation::Standard},
  {GLFW_KEY_KP_DECIMAL,    110, "",            "NumpadDecimal",  KeyLocation::Numpad},
  {GLFW_KEY_KP_DIVIDE,     111, "",            "NumpadDivide",   KeyLocation::Numpad},
  {GLFW_KEY_KP_MULTIPLY,   106, "",            "NumpadMultiply", KeyLocation::Numpad},
  {GLFW_KEY_KP_SUBTRACT,   109, "",            "NumpadSubtract", KeyLocation::Numpad},
  {GLFW_KEY_KP_ADD,        107, "",            "NumpadAdd",      KeyLocation::Numpad},
  {GLFW_KEY_KP_ENTER,      13,  "Enter",       "NumpadEnter",    KeyLocation::Numpad},
  {GLFW_KEY_LEFT_SHIFT,    16,  "Shift",       "ShiftLeft",    KeyLocation::Left},
  {GLFW_KEY_LEFT_CONTROL,  17,  "Control",     "ControlLeft",  KeyLocation::Left},
  {GLFW_KEY_LEFT_ALT,      18,  "Alt",         "AltLeft",      KeyLocation::Left},
  {GLFW_KEY_LEFT_SUPER,    91,  "Meta",        "MetaLeft",     KeyLocation::Left},
  {GLFW_KEY_RIGHT_SHIFT,   16,  "Shift",       "ShiftRight",   KeyLocation::Right},
  {GLFW_KEY_RIGHT_CONTROL, 17,  "Control",     "ControlRight", KeyLocation::Right},
  {GLFW_KEY_RIGHT_ALT,     18,  "Alt",         "AltRight",     KeyLocation::Right},
  {GLFW_KEY_RIGHT_SUPER,   92,  "Meta",        "MetaRight",    KeyLocation::Right},
  {GLFW_KEY_MENU,          93,  "ContextMenu", "ContextMenu",  KeyLocation::Standard},
};

bool translateKey(int glfwKey, RawKeyEvent& e) {
  if (glfwKey >= GLFW_KEY_A && glfwKey <= GLFW_KEY_Z) {
    char letter = static_cast<char>('A' + (glfwKey - GLFW_KEY_A));
    e.keyCode = letter;
    e.code = std::string("Key") + letter;
    return true;
  }
  if (glfwKey >= GLFW_KEY_0 && glfwKey <= GLFW_KEY_9) {
    char digit = static_cast<char>('0' + (glfwKey - GLFW_KEY_0));
    e.keyCode = digit;
    e.code = std::string("Digit") + digit;
    return true;
  }
  if (glfwKey >= GLFW_KEY_KP_0 && glfwKey <= GLFW_KEY_KP_9) {
    int n = glfwKey - GLFW_KEY_KP_0;
    e.keyCode = 96 + n;
    e.code = "Numpad" + std::to_string(n);
    e.location = KeyLocation::Numpad;
    return true;
  }
  if (glfwKey >= GLFW_KEY_F1 && glfwKey <= GLFW_KEY_F12) {
    int n = glfwKey - GLFW_KEY_F1 + 1;
    e.keyCode = 111 + n;
    e.key = "F" + std::to_string(n);
    e.code = e.key;
    return true;
  }
  for (const auto& k : kKeyTable) {
    if (k.glfwKey != glfwKey) continue;
    e.keyCode = k.keyCode;
    e.key = k.key;
    e.code = k.code;
    e.location = k.location;
    return true;
  }
  return false;
}

ModifierState modifiersFromGlfw(int mods) {
  ModifierState m;
  m.shift = (mods & GLFW_MOD_SHIFT) != 0;
  m.ctrl = (mods & GLFW_MOD_CONTROL) != 0;
  m.alt = (mods & GLFW_MOD_ALT) != 0;
  m.meta = (mods & GLFW_MOD_SUPER) != 0;
  return m;
}

// GLFW reports the modifier state from before a modifier key's own event.
void applyOwnModifier(int glfwKey, bool down, ModifierState& m) {
  switch (glfwKey) {
    case GLFW_KEY_LEFT_SHIFT: case GLFW_KEY_RIGHT_SHIFT: m.shift = down; break;
    case GLFW_KEY_LEFT_CONTROL: case GLFW_KEY_RIGHT_CONTROL: m.ctrl = down; break;
    case GLFW_KEY_LEFT_ALT: case GLFW_KEY_RIGHT_ALT: m.alt = down; break;
    case GLFW_KEY_LEFT_SUPER: case GLFW_KEY_RIGHT_SUPER: m.meta = down; break;
    default: break;
  }
}

int domButton(int glfwButton) {
  if (glfwButton == GLFW_MOUSE_BUTTON_RIGHT) return 2;
  if (glfwButton == GLFW_MOUSE_BUTTON_MIDDLE) return 1;
  return glfwButton;
}

// Pixels per scroll notch, matching a browser's DOM_DELTA_PIXEL wheel.
constexpr double kPixelsPerNotch = 100.0;

} // namespace

GlfwInputSource::GlfwInputSource(InputSession& session) : session_(session) {}

GlfwInputSource::~GlfwInputSource() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwInputSource::init(int width, int height, const std::string& title) {
  if (!glfwInit()) {
    std::fprintf(stderr, "[GlfwInputSource] glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
  window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "[GlfwInputSource] glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetCharCallback(window_, charCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetWindowFocusCallback(window_, focusCallback);
  glfwSetWindowSizeCallback(window_, sizeCallback);

  glfwGetCursorPos(window_, &lastCursorX_, &lastCursorY_);
  emitResize();
  return true;
}

void GlfwInputSource::setCanvasSize(int width, int height) {
  canvasW_ = width;
  canvasH_ = height;
  if (window_) emitResize();
}

double GlfwInputSource::nowMs() const {
  return glfwGetTime() * 1000.0;
}

bool GlfwInputSource::poll() {
  glfwPollEvents();
  samplePads();
  return window_ && !glfwWindowShouldClose(window_);
}

void GlfwInputSource::emitResize() {
  int winW = 0, winH = 0, fbW = 0, fbH = 0;
  glfwGetWindowSize(window_, &winW, &winH);
  glfwGetFramebufferSize(window_, &fbW, &fbH);

  SurfaceGeometry g;
  g.element.width = winW;
  g.element.height = winH;
  g.bodyWidth = winW;
  g.bodyHeight = winH;
  g.devicePixelRatio = winW > 0 ? static_cast<double>(fbW) / winW : 1.0;
  g.canvasWidth = canvasW_ > 0 ? canvasW_ : fbW;
  g.canvasHeight = canvasH_ > 0 ? canvasH_ : fbH;
  session_.resize(g);
}

void GlfwInputSource::setLocked(bool locked) {
  locked_ = locked;
  glfwSetInputMode(window_, GLFW_CURSOR, locked ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
  if (glfwRawMouseMotionSupported()) {
    glfwSetInputMode(window_, GLFW_RAW_MOUSE_MOTION, locked ? GLFW_TRUE : GLFW_FALSE);
  }
  glfwGetCursorPos(window_, &lastCursorX_, &lastCursorY_);
  session_.pointerLockChanged(locked);
}

bool GlfwInputSource::hasPointerLock() const { return window_ != nullptr; }
bool GlfwInputSource::hasKeyboardLock() const { return window_ != nullptr; }
bool GlfwInputSource::hasFullscreen() const { return window_ != nullptr; }

bool GlfwInputSource::requestPointerLock() {
  if (!window_) return false;
  if (!locked_) setLocked(true);
  return true;
}

void GlfwInputSource::exitPointerLock() {
  if (window_ && locked_) setLocked(false);
}

bool GlfwInputSource::requestKeyboardLock(const std::vector<std::string>& codes) {
  // A focused GLFW window already receives every key.
  (void)codes;
  return window_ != nullptr;
}

bool GlfwInputSource::requestFullscreen() {
  if (!window_ || fullscreen_) return false;
  GLFWmonitor* monitor = glfwGetPrimaryMonitor();
  const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
  if (!mode) return false;

  glfwGetWindowPos(window_, &windowedX_, &windowedY_);
  glfwGetWindowSize(window_, &windowedW_, &windowedH_);
  glfwSetWindowMonitor(window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
  fullscreen_ = true;
  session_.fullscreenChanged(true);
  return true;
}

void GlfwInputSource::samplePads() {
  for (int jid = 0; jid < kMaxPads; jid++) {
    PadState& pad = pads_[static_cast<std::size_t>(jid)];
    bool present = glfwJoystickIsGamepad(jid) == GLFW_TRUE;

    if (!present) {
      if (pad.connected) {
        pad = PadState{};
        session_.gamepadDisconnected(jid);
      }
      continue;
    }

    // A detach forgets every pad; announce it again with fresh state.
    if (!pad.connected || !session_.gamepads().isConnected(jid)) {
      pad = PadState{};
      pad.connected = true;
      const char* name = glfwGetGamepadName(jid);
      session_.gamepadConnected(jid, name ? name : "", kPadAxes, kPadButtons);
    }

    GLFWgamepadstate state;
    if (!glfwGetGamepadState(jid, &state)) continue;

    for (int b = 0; b < kPadButtons; b++) {
      float v = state.buttons[b] == GLFW_PRESS ? 1.0f : 0.0f;
      if (v != pad.buttons[static_cast<std::size_t>(b)]) {
        pad.buttons[static_cast<std::size_t>(b)] = v;
        session_.gamepadButton(jid, b, v);
      }
    }
    for (int a = 0; a < kPadAxes; a++) {
      float v = state.axes[a];
      if (std::fabs(v - pad.axes[static_cast<std::size_t>(a)]) > 0.01f) {
        pad.axes[static_cast<std::size_t>(a)] = v;
        session_.gamepadAxis(jid, a, v);
      }
    }
  }
}

void GlfwInputSource::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int mods) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (!self || action == GLFW_REPEAT) return;

  // Escape leaves a windowed pointer lock, as a browser does.
  if (key == GLFW_KEY_ESCAPE && self->locked_ && !self->fullscreen_) {
    if (action == GLFW_PRESS) self->exitPointerLock();
    return;
  }

  RawKeyEvent e;
  if (!translateKey(key, e)) return;
  bool down = action == GLFW_PRESS;
  e.kind = down ? KeyEventKind::KeyDown : KeyEventKind::KeyUp;
  e.modifiers = modifiersFromGlfw(mods);
  applyOwnModifier(key, down, e.modifiers);
  e.timestampMs = self->nowMs();
  e.token = self->nextToken_++;

  if (down) self->session_.keyDown(e);
  else self->session_.keyUp(e);
}

void GlfwInputSource::charCallback(GLFWwindow* w, unsigned int codepoint) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  RawKeyEvent e;
  e.kind = KeyEventKind::KeyPress;
  e.keyCode = static_cast<int>(codepoint);
  e.timestampMs = self->nowMs();
  e.token = self->nextToken_++;
  self->session_.keyPress(e);
}

void GlfwInputSource::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  MouseEvent e;
  e.kind = MouseEventKind::Move;
  e.clientX = x;
  e.clientY = y;
  e.movementX = x - self->lastCursorX_;
  e.movementY = y - self->lastCursorY_;
  e.token = self->nextToken_++;
  self->lastCursorX_ = x;
  self->lastCursorY_ = y;
  self->session_.mouse(e);
}

void GlfwInputSource::mouseButtonCallback(GLFWwindow* w, int button, int action, int mods) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  MouseEvent e;
  e.kind = action == GLFW_PRESS ? MouseEventKind::Down : MouseEventKind::Up;
  e.clientX = self->lastCursorX_;
  e.clientY = self->lastCursorY_;
  e.button = domButton(button);
  e.modifiers = modifiersFromGlfw(mods);
  e.token = self->nextToken_++;
  self->session_.mouse(e);
}

void GlfwInputSource::scrollCallback(GLFWwindow* w, double /*xoff*/, double yoff) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  WheelEvent e;
  e.deltaY = -yoff * kPixelsPerNotch;
  e.token = self->nextToken_++;
  self->session_.wheel(e);
}

void GlfwInputSource::focusCallback(GLFWwindow* w, int focused) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (!self || focused) return;

  self->session_.focusLost();
  if (self->locked_) self->setLocked(false);
  if (self->fullscreen_) {
    glfwSetWindowMonitor(w, nullptr, self->windowedX_, self->windowedY_,
                         self->windowedW_, self->windowedH_, 0);
    self->fullscreen_ = false;
    self->session_.fullscreenChanged(false);
  }
}

void GlfwInputSource::sizeCallback(GLFWwindow* w, int /*width*/, int /*height*/) {
  auto* self = static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w));
  if (self) self->emitResize();
}

} // namespace ri

#endif // RI_HAS_GLFW
