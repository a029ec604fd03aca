#include "ri/session/InputConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace ri {

static void readNumber(const rapidjson::Value& obj, const char* name, double& out) {
  if (obj.HasMember(name) && obj[name].IsNumber()) out = obj[name].GetDouble();
}

static void readInt(const rapidjson::Value& obj, const char* name, int& out) {
  if (obj.HasMember(name) && obj[name].IsInt()) out = obj[name].GetInt();
}

static void readBool(const rapidjson::Value& obj, const char* name, bool& out) {
  if (obj.HasMember(name) && obj[name].IsBool()) out = obj[name].GetBool();
}

std::string serializeInputConfig(const InputConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", rapidjson::Value(cfg.version.c_str(), alloc), alloc);
  doc.AddMember("platform", rapidjson::Value(cfg.platform.c_str(), alloc), alloc);
  doc.AddMember("hotkeysEnabled", cfg.hotkeysEnabled, alloc);

  rapidjson::Value repeat(rapidjson::kObjectType);
  repeat.AddMember("enabled", cfg.repeat.enabled, alloc);
  repeat.AddMember("delayMs", cfg.repeat.delayMs, alloc);
  repeat.AddMember("intervalMs", cfg.repeat.intervalMs, alloc);
  repeat.AddMember("gapMs", cfg.repeat.gapMs, alloc);
  doc.AddMember("repeat", repeat, alloc);

  rapidjson::Value comp(rapidjson::kObjectType);
  comp.AddMember("releaseDelayMs", cfg.composition.releaseDelayMs, alloc);
  doc.AddMember("composition", comp, alloc);

  rapidjson::Value ptr(rapidjson::kObjectType);
  ptr.AddMember("manualResolution", cfg.pointer.manualResolution, alloc);
  ptr.AddMember("remoteResolution", cfg.pointer.remoteResolution, alloc);
  ptr.AddMember("cursorScaleFactor", cfg.pointer.cursorScaleFactor, alloc);
  doc.AddMember("pointer", ptr, alloc);

  rapidjson::Value touch(rapidjson::kObjectType);
  touch.AddMember("moveThresholdPx", cfg.touch.moveThresholdPx, alloc);
  touch.AddMember("tapMaxMs", cfg.touch.tapMaxMs, alloc);
  touch.AddMember("tapReleaseDelayMs", cfg.touch.tapReleaseDelayMs, alloc);
  touch.AddMember("swipeMaxMs", cfg.touch.swipeMaxMs, alloc);
  touch.AddMember("swipeMinDistancePx", cfg.touch.swipeMinDistancePx, alloc);
  touch.AddMember("swipeDominance", cfg.touch.swipeDominance, alloc);
  touch.AddMember("swipePxPerTick", cfg.touch.swipePxPerTick, alloc);
  touch.AddMember("swipeMaxTicks", cfg.touch.swipeMaxTicks, alloc);
  doc.AddMember("touch", touch, alloc);

  rapidjson::Value wheel(rapidjson::kObjectType);
  wheel.AddMember("throttleMs", cfg.wheel.throttleMs, alloc);
  wheel.AddMember("burstWindow", cfg.wheel.burstWindow, alloc);
  wheel.AddMember("burstMinDelta", cfg.wheel.burstMinDelta, alloc);
  wheel.AddMember("burstRepeatCount", cfg.wheel.burstRepeatCount, alloc);
  wheel.AddMember("maxTicks", cfg.wheel.maxTicks, alloc);
  doc.AddMember("wheel", wheel, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeInputConfig(const std::string& json, InputConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();
  if (doc.HasMember("platform") && doc["platform"].IsString())
    out.platform = doc["platform"].GetString();
  readBool(doc, "hotkeysEnabled", out.hotkeysEnabled);

  if (doc.HasMember("repeat") && doc["repeat"].IsObject()) {
    const auto& r = doc["repeat"];
    readBool(r, "enabled", out.repeat.enabled);
    readNumber(r, "delayMs", out.repeat.delayMs);
    readNumber(r, "intervalMs", out.repeat.intervalMs);
    readNumber(r, "gapMs", out.repeat.gapMs);
    out.repeat = clampRepeatConfig(out.repeat);
  }

  if (doc.HasMember("composition") && doc["composition"].IsObject()) {
    readNumber(doc["composition"], "releaseDelayMs", out.composition.releaseDelayMs);
  }

  if (doc.HasMember("pointer") && doc["pointer"].IsObject()) {
    const auto& p = doc["pointer"];
    readBool(p, "manualResolution", out.pointer.manualResolution);
    readBool(p, "remoteResolution", out.pointer.remoteResolution);
    readNumber(p, "cursorScaleFactor", out.pointer.cursorScaleFactor);
  }

  if (doc.HasMember("touch") && doc["touch"].IsObject()) {
    const auto& t = doc["touch"];
    readNumber(t, "moveThresholdPx", out.touch.moveThresholdPx);
    readNumber(t, "tapMaxMs", out.touch.tapMaxMs);
    readNumber(t, "tapReleaseDelayMs", out.touch.tapReleaseDelayMs);
    readNumber(t, "swipeMaxMs", out.touch.swipeMaxMs);
    readNumber(t, "swipeMinDistancePx", out.touch.swipeMinDistancePx);
    readNumber(t, "swipeDominance", out.touch.swipeDominance);
    readNumber(t, "swipePxPerTick", out.touch.swipePxPerTick);
    readInt(t, "swipeMaxTicks", out.touch.swipeMaxTicks);
  }

  if (doc.HasMember("wheel") && doc["wheel"].IsObject()) {
    const auto& w = doc["wheel"];
    readNumber(w, "throttleMs", out.wheel.throttleMs);
    readInt(w, "burstWindow", out.wheel.burstWindow);
    readInt(w, "burstMinDelta", out.wheel.burstMinDelta);
    readInt(w, "burstRepeatCount", out.wheel.burstRepeatCount);
    readInt(w, "maxTicks", out.wheel.maxTicks);
  }

  return true;
}

bool loadInputConfigFile(const std::string& path, InputConfig& out) {
  std::ifstream f(path);
  if (!f) {
    std::fprintf(stderr, "[InputConfig] cannot open %s\n", path.c_str());
    return false;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  if (!deserializeInputConfig(ss.str(), out)) {
    std::fprintf(stderr, "[InputConfig] malformed JSON in %s\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace ri
