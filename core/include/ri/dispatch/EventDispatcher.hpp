#pragma once
#include "ri/keyboard/KeyEvent.hpp"
#include "ri/pointer/PointerEvent.hpp"

#include <cstdint>
#include <string>

#include <rapidjson/document.h>

namespace ri {

class InputSession;
class TimerQueue;

struct DispatchError {
  std::string code;     // e.g. "VALIDATION_MISSING_FIELD"
  std::string message;  // human text
  std::string details;  // small JSON string
};

struct DispatchResult {
  bool ok{true};
  DispatchError err{};
  bool preventDefault{false};
};

// Applies JSON event objects ({"type":"keydown", ...}) to a session.
// With a TimerQueue attached, {"type":"advance","ms":N} moves time forward.
class EventDispatcher {
public:
  explicit EventDispatcher(InputSession& session, TimerQueue* timers = nullptr);

  // Apply a single JSON event object.
  DispatchResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  DispatchResult applyJsonText(const std::string& jsonText);

  std::uint64_t appliedCount() const { return applied_; }

private:
  InputSession& session_;
  TimerQueue* timers_;
  std::uint64_t applied_{0};

  // ---- handlers ----
  DispatchResult evKey(const rapidjson::Value& obj, KeyEventKind kind);
  DispatchResult evMouse(const rapidjson::Value& obj, MouseEventKind kind);
  DispatchResult evWheel(const rapidjson::Value& obj);
  DispatchResult evTouch(const rapidjson::Value& obj, TouchEventKind kind);
  DispatchResult evComposition(const rapidjson::Value& obj, const std::string& type);
  DispatchResult evGamepad(const rapidjson::Value& obj, const std::string& type);
  DispatchResult evResize(const rapidjson::Value& obj);
  DispatchResult evFullscreen(const rapidjson::Value& obj);
  DispatchResult evPointerLock(const rapidjson::Value& obj);
  DispatchResult evAdvance(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  // Absent or non-numeric fields leave `out` untouched and return true.
  // A number that is not finite or exceeds `limit` in magnitude returns false.
  static bool readNumber(const rapidjson::Value& obj, const char* key, double limit, double& out);
  static bool readInt(const rapidjson::Value& obj, const char* key, int& out);
  static bool getBoolOr(const rapidjson::Value& obj, const char* key, bool fallback);
  static std::uint64_t getToken(const rapidjson::Value& obj);
  static ModifierState getModifiers(const rapidjson::Value& obj);
  static DispatchResult fail(const std::string& code,
                             const std::string& message,
                             const std::string& detailsJson = "{}");
  static DispatchResult missing(const std::string& type, const char* field);
  static DispatchResult outOfRange(const std::string& type, const char* field);
  static DispatchResult done(bool preventDefault);
};

} // namespace ri
