#include "ri/dispatch/EventDispatcher.hpp"
#include "ri/sched/TimerQueue.hpp"
#include "ri/session/InputSession.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <limits>
#include <string>

namespace ri {

// Pixel-valued fields (coordinates, deltas, geometry) beyond this are rejected
// before anything converts them to int.
static constexpr double kMaxPixels = 1e6;
static constexpr double kMaxInt = static_cast<double>(std::numeric_limits<int>::max());
static constexpr double kMaxFinite = std::numeric_limits<double>::max();

EventDispatcher::EventDispatcher(InputSession& session, TimerQueue* timers)
  : session_(session), timers_(timers) {}

DispatchResult EventDispatcher::fail(const std::string& code,
                                     const std::string& message,
                                     const std::string& detailsJson) {
  DispatchResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

DispatchResult EventDispatcher::missing(const std::string& type, const char* field) {
  return fail("VALIDATION_MISSING_FIELD",
              type + ": missing field " + field,
              std::string(R"({"field":")") + field + R"("})");
}

DispatchResult EventDispatcher::outOfRange(const std::string& type, const char* field) {
  return fail("BAD_EVENT",
              type + ": number out of range in " + field,
              std::string(R"({"field":")") + field + R"("})");
}

DispatchResult EventDispatcher::done(bool preventDefault) {
  DispatchResult r;
  r.preventDefault = preventDefault;
  return r;
}

const rapidjson::Value* EventDispatcher::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string EventDispatcher::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

bool EventDispatcher::readNumber(const rapidjson::Value& obj, const char* key,
                                 double limit, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return true;
  double d = v->GetDouble();
  if (!std::isfinite(d) || std::fabs(d) > limit) return false;
  out = d;
  return true;
}

bool EventDispatcher::readInt(const rapidjson::Value& obj, const char* key, int& out) {
  double d = out;
  if (!readNumber(obj, key, kMaxInt, d)) return false;
  out = static_cast<int>(d);
  return true;
}

bool EventDispatcher::getBoolOr(const rapidjson::Value& obj, const char* key, bool fallback) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsBool()) return fallback;
  return v->GetBool();
}

std::uint64_t EventDispatcher::getToken(const rapidjson::Value& obj) {
  const auto* v = getMember(obj, "token");
  if (!v) return 0;
  if (v->IsUint64()) return v->GetUint64();
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<std::uint64_t>(v->GetInt64());
  return 0;
}

ModifierState EventDispatcher::getModifiers(const rapidjson::Value& obj) {
  ModifierState m;
  m.shift = getBoolOr(obj, "shiftKey", false);
  m.ctrl = getBoolOr(obj, "ctrlKey", false);
  m.alt = getBoolOr(obj, "altKey", false);
  m.meta = getBoolOr(obj, "metaKey", false);
  m.hyper = getBoolOr(obj, "hyperKey", false);
  return m;
}

DispatchResult EventDispatcher::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_EVENT", "EventDispatcher: invalid JSON object");
  }

  return applyJson(d);
}

DispatchResult EventDispatcher::applyJson(const rapidjson::Value& obj) {
  const auto* typeV = getMember(obj, "type");
  if (!typeV || !typeV->IsString()) {
    return fail("BAD_EVENT", "Missing string field: type");
  }

  const std::string type = typeV->GetString();

  // Session lifecycle and environment signals apply in any state.
  if (type == "attach") { session_.attach(); applied_++; return done(false); }
  if (type == "detach") { session_.detach(); applied_++; return done(false); }
  if (type == "resize") return evResize(obj);
  if (type == "fullscreenchange") return evFullscreen(obj);
  if (type == "pointerlockchange") return evPointerLock(obj);
  if (type == "advance") return evAdvance(obj);

  bool known =
    type == "keydown" || type == "keypress" || type == "keyup" ||
    type == "mousemove" || type == "mousedown" || type == "mouseup" ||
    type == "wheel" || type == "touchstart" || type == "touchmove" ||
    type == "touchend" || type == "touchcancel" ||
    type == "compositionstart" || type == "compositionupdate" ||
    type == "compositionend" || type == "gamepadconnected" ||
    type == "gamepaddisconnected" || type == "gamepadbutton" ||
    type == "gamepadaxis" || type == "blur" || type == "contextmenu";
  if (!known) {
    return fail("UNKNOWN_EVENT",
                "Unknown type",
                std::string(R"({"type":")") + type + R"("})");
  }

  if (!session_.attached()) {
    return fail("NOT_ATTACHED", type + ": session is detached");
  }

  std::uint64_t token = getToken(obj);
  if (session_.tokens().seen(token)) {
    return fail("DUPLICATE_TOKEN", type + ": event already handled",
                std::string(R"({"token":)") + std::to_string(token) + "}");
  }

  if (type == "keydown") return evKey(obj, KeyEventKind::KeyDown);
  if (type == "keypress") return evKey(obj, KeyEventKind::KeyPress);
  if (type == "keyup") return evKey(obj, KeyEventKind::KeyUp);

  if (type == "mousemove") return evMouse(obj, MouseEventKind::Move);
  if (type == "mousedown") return evMouse(obj, MouseEventKind::Down);
  if (type == "mouseup") return evMouse(obj, MouseEventKind::Up);
  if (type == "wheel") return evWheel(obj);

  if (type == "touchstart") return evTouch(obj, TouchEventKind::Start);
  if (type == "touchmove") return evTouch(obj, TouchEventKind::Move);
  if (type == "touchend") return evTouch(obj, TouchEventKind::End);
  if (type == "touchcancel") return evTouch(obj, TouchEventKind::Cancel);

  if (type.compare(0, 11, "composition") == 0) return evComposition(obj, type);
  if (type.compare(0, 7, "gamepad") == 0) return evGamepad(obj, type);

  if (type == "blur") {
    session_.focusLost();
    applied_++;
    return done(false);
  }

  // contextmenu
  bool pd = session_.contextMenu(token);
  applied_++;
  return done(pd);
}

// -------------------- keyboard --------------------

DispatchResult EventDispatcher::evKey(const rapidjson::Value& obj, KeyEventKind kind) {
  RawKeyEvent e;
  e.kind = kind;
  e.key = getStringOrEmpty(obj, "key");
  e.keyIdentifier = getStringOrEmpty(obj, "keyIdentifier");
  e.code = getStringOrEmpty(obj, "code");
  e.modifiers = getModifiers(obj);
  e.isComposing = getBoolOr(obj, "isComposing", false);
  e.token = getToken(obj);

  const std::string type = kind == KeyEventKind::KeyDown ? "keydown"
                         : kind == KeyEventKind::KeyPress ? "keypress" : "keyup";

  if (!readNumber(obj, "timeStamp", kMaxFinite, e.timestampMs)) return outOfRange(type, "timeStamp");

  int loc = 0;
  if (!readInt(obj, "location", loc)) return outOfRange(type, "location");
  if (loc >= 0 && loc <= 3) e.location = static_cast<KeyLocation>(loc);

  if (kind == KeyEventKind::KeyPress) {
    const char* field = "charCode";
    const auto* cc = getMember(obj, field);
    if (!cc || !cc->IsNumber()) field = "keyCode";
    cc = getMember(obj, field);
    if (!cc || !cc->IsNumber()) return missing(type, "charCode");
    if (!readInt(obj, field, e.keyCode)) return outOfRange(type, field);
  } else {
    const auto* kc = getMember(obj, "keyCode");
    if (kc && kc->IsNumber()) {
      if (!readInt(obj, "keyCode", e.keyCode)) return outOfRange(type, "keyCode");
    } else if (e.key.empty() && e.keyIdentifier.empty()) {
      return missing(type, "keyCode");
    }
  }

  bool pd = false;
  if (kind == KeyEventKind::KeyDown) pd = session_.keyDown(e);
  else if (kind == KeyEventKind::KeyPress) pd = session_.keyPress(e);
  else pd = session_.keyUp(e);
  applied_++;
  return done(pd);
}

// -------------------- pointer --------------------

DispatchResult EventDispatcher::evMouse(const rapidjson::Value& obj, MouseEventKind kind) {
  const std::string type = kind == MouseEventKind::Move ? "mousemove"
                         : kind == MouseEventKind::Down ? "mousedown" : "mouseup";

  MouseEvent e;
  e.kind = kind;
  if (!readNumber(obj, "clientX", kMaxPixels, e.clientX)) return outOfRange(type, "clientX");
  if (!readNumber(obj, "clientY", kMaxPixels, e.clientY)) return outOfRange(type, "clientY");
  if (!readNumber(obj, "movementX", kMaxPixels, e.movementX)) return outOfRange(type, "movementX");
  if (!readNumber(obj, "movementY", kMaxPixels, e.movementY)) return outOfRange(type, "movementY");
  e.modifiers = getModifiers(obj);
  e.token = getToken(obj);

  if (kind != MouseEventKind::Move) {
    const auto* b = getMember(obj, "button");
    if (!b || !b->IsInt()) return missing(type, "button");
    e.button = b->GetInt();
  }

  bool pd = session_.mouse(e);
  applied_++;
  return done(pd);
}

DispatchResult EventDispatcher::evWheel(const rapidjson::Value& obj) {
  const auto* dy = getMember(obj, "deltaY");
  if (!dy || !dy->IsNumber()) return missing("wheel", "deltaY");

  WheelEvent e;
  if (!readNumber(obj, "deltaY", kMaxPixels, e.deltaY)) return outOfRange("wheel", "deltaY");
  e.token = getToken(obj);
  bool pd = session_.wheel(e);
  applied_++;
  return done(pd);
}

DispatchResult EventDispatcher::evTouch(const rapidjson::Value& obj, TouchEventKind kind) {
  const auto* touches = getMember(obj, "touches");
  if (!touches || !touches->IsArray()) return missing("touch", "touches");

  TouchEvent e;
  e.kind = kind;
  e.token = getToken(obj);
  if (!readNumber(obj, "timeStamp", kMaxFinite, e.timestampMs)) return outOfRange("touch", "timeStamp");

  for (rapidjson::SizeType i = 0; i < touches->Size(); i++) {
    const auto& t = (*touches)[i];
    const auto* id = getMember(t, "id");
    if (!id || !id->IsInt()) return missing("touch", "id");
    TouchPoint p;
    p.id = id->GetInt();
    if (!readNumber(t, "clientX", kMaxPixels, p.clientX)) return outOfRange("touch", "clientX");
    if (!readNumber(t, "clientY", kMaxPixels, p.clientY)) return outOfRange("touch", "clientY");
    e.changed.push_back(p);
  }

  bool pd = session_.touch(e);
  applied_++;
  return done(pd);
}

// -------------------- composition / gamepad --------------------

DispatchResult EventDispatcher::evComposition(const rapidjson::Value& obj, const std::string& type) {
  std::uint64_t token = getToken(obj);
  std::string data = getStringOrEmpty(obj, "data");

  if (type == "compositionstart") session_.compositionStart(token);
  else if (type == "compositionupdate") session_.compositionUpdate(data, token);
  else session_.compositionEnd(data, token);
  applied_++;
  return done(false);
}

DispatchResult EventDispatcher::evGamepad(const rapidjson::Value& obj, const std::string& type) {
  const auto* idx = getMember(obj, "index");
  if (!idx || !idx->IsInt()) return missing(type, "index");
  int index = idx->GetInt();

  if (type == "gamepadconnected") {
    int axes = 0;
    int buttons = 0;
    if (!readInt(obj, "axes", axes)) return outOfRange(type, "axes");
    if (!readInt(obj, "buttons", buttons)) return outOfRange(type, "buttons");
    session_.gamepadConnected(index, getStringOrEmpty(obj, "id"), axes, buttons);
  } else if (type == "gamepaddisconnected") {
    session_.gamepadDisconnected(index);
  } else {
    const char* field = type == "gamepadbutton" ? "button" : "axis";
    const auto* which = getMember(obj, field);
    if (!which || !which->IsInt()) return missing(type, field);
    const auto* value = getMember(obj, "value");
    if (!value || !value->IsNumber()) return missing(type, "value");
    double v = 0;
    if (!readNumber(obj, "value", kMaxFinite, v)) return outOfRange(type, "value");

    if (type == "gamepadbutton") session_.gamepadButton(index, which->GetInt(), v);
    else session_.gamepadAxis(index, which->GetInt(), v);
  }
  applied_++;
  return done(false);
}

// -------------------- environment --------------------

DispatchResult EventDispatcher::evResize(const rapidjson::Value& obj) {
  SurfaceGeometry g = session_.geometry();

  const auto* el = getMember(obj, "element");
  if (el && el->IsObject()) {
    g.element = {};
    if (!readNumber(*el, "left", kMaxPixels, g.element.left)) return outOfRange("resize", "left");
    if (!readNumber(*el, "top", kMaxPixels, g.element.top)) return outOfRange("resize", "top");
    if (!readNumber(*el, "width", kMaxPixels, g.element.width)) return outOfRange("resize", "width");
    if (!readNumber(*el, "height", kMaxPixels, g.element.height)) return outOfRange("resize", "height");
  }

  double canvasW = g.canvasWidth;
  double canvasH = g.canvasHeight;
  if (!readNumber(obj, "canvasWidth", kMaxPixels, canvasW)) return outOfRange("resize", "canvasWidth");
  if (!readNumber(obj, "canvasHeight", kMaxPixels, canvasH)) return outOfRange("resize", "canvasHeight");
  g.canvasWidth = static_cast<int>(canvasW);
  g.canvasHeight = static_cast<int>(canvasH);

  g.bodyWidth = g.element.width;
  g.bodyHeight = g.element.height;
  if (!readNumber(obj, "bodyWidth", kMaxPixels, g.bodyWidth)) return outOfRange("resize", "bodyWidth");
  if (!readNumber(obj, "bodyHeight", kMaxPixels, g.bodyHeight)) return outOfRange("resize", "bodyHeight");
  if (!readNumber(obj, "devicePixelRatio", kMaxPixels, g.devicePixelRatio))
    return outOfRange("resize", "devicePixelRatio");

  session_.resize(g);
  applied_++;
  return done(false);
}

DispatchResult EventDispatcher::evFullscreen(const rapidjson::Value& obj) {
  const auto* v = getMember(obj, "fullscreen");
  if (!v || !v->IsBool()) return missing("fullscreenchange", "fullscreen");
  session_.fullscreenChanged(v->GetBool());
  applied_++;
  return done(false);
}

DispatchResult EventDispatcher::evPointerLock(const rapidjson::Value& obj) {
  const auto* v = getMember(obj, "locked");
  if (!v || !v->IsBool()) return missing("pointerlockchange", "locked");
  session_.pointerLockChanged(v->GetBool());
  applied_++;
  return done(false);
}

DispatchResult EventDispatcher::evAdvance(const rapidjson::Value& obj) {
  if (!timers_) return fail("BAD_EVENT", "advance: no timer queue attached");
  const auto* v = getMember(obj, "ms");
  if (!v || !v->IsNumber()) return missing("advance", "ms");
  double ms = 0;
  if (!readNumber(obj, "ms", kMaxFinite, ms)) return outOfRange("advance", "ms");
  timers_->advanceBy(ms);
  applied_++;
  return done(false);
}

} // namespace ri
