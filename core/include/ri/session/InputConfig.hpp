#pragma once
#include "ri/keyboard/CompositionHandler.hpp"
#include "ri/keyboard/KeyboardReconciler.hpp"
#include "ri/pointer/TouchMapper.hpp"
#include "ri/pointer/WheelSmoother.hpp"

#include <string>

namespace ri {

struct PointerConfig {
  bool manualResolution{false};  // stretch to the canvas instead of letterboxing
  bool remoteResolution{false};  // server follows client size, no DPI factor
  double cursorScaleFactor{0};   // > 0 forces a relative-motion factor
};

// Everything tunable about an input session.
struct InputConfig {
  std::string version{"1.0"};
  std::string platform;          // navigator.platform style, selects quirks
  bool hotkeysEnabled{true};

  KeyRepeatConfig repeat;
  CompositionConfig composition;
  PointerConfig pointer;
  TouchConfig touch;
  WheelConfig wheel;
};

// Serialize InputConfig to a JSON string.
std::string serializeInputConfig(const InputConfig& cfg);

// Parse JSON into `out`. Absent fields keep their current values.
// Returns false on malformed JSON.
bool deserializeInputConfig(const std::string& json, InputConfig& out);

// Read and parse a config file. Returns false if unreadable or malformed.
bool loadInputConfigFile(const std::string& path, InputConfig& out);

} // namespace ri
