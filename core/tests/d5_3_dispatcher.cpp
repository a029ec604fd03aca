// D5.3 - JSON event dispatcher
// Tests: lifecycle events, key/mouse/wheel/touch/composition/gamepad
// routing, timer advance, error codes (BAD_EVENT, UNKNOWN_EVENT,
// NOT_ATTACHED, DUPLICATE_TOKEN, VALIDATION_MISSING_FIELD), numbers outside
// the representable range rejected before they reach the session.

#include "ri/dispatch/EventDispatcher.hpp"
#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TimerQueue.hpp"
#include "ri/session/InputSession.hpp"

#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireOk(const ri::DispatchResult& r, const char* msg) {
  if (!r.ok) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%s: %s)\n", msg,
                 r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

static const char* kResize =
  R"({"type":"resize","element":{"left":0,"top":0,"width":800,"height":600},)"
  R"("canvasWidth":800,"canvasHeight":600})";

int main() {
  using namespace ri;

  // --- Test 1: errors before attach ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    EventDispatcher d(s, &timers);

    auto r = d.applyJsonText("not json");
    requireTrue(!r.ok && r.err.code == "BAD_EVENT", "invalid JSON");
    r = d.applyJsonText(R"({"keyCode":13})");
    requireTrue(!r.ok && r.err.code == "BAD_EVENT", "missing type");
    r = d.applyJsonText(R"({"type":"teleport"})");
    requireTrue(!r.ok && r.err.code == "UNKNOWN_EVENT", "unknown type");
    requireTrue(r.err.details == R"({"type":"teleport"})", "details name the type");
    r = d.applyJsonText(R"({"type":"keydown","keyCode":13,"key":"Enter"})");
    requireTrue(!r.ok && r.err.code == "NOT_ATTACHED", "detached");
    requireTrue(log.empty() && d.appliedCount() == 0, "nothing applied");

    std::printf("  Test 1 (errors) PASS\n");
  }

  // --- Test 2: keyboard routing ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    EventDispatcher d(s, &timers);

    requireOk(d.applyJsonText(R"({"type":"attach"})"), "attach");
    requireTrue(s.attached(), "attached");

    requireOk(d.applyJsonText(R"({"type":"keydown","keyCode":65,"key":"a","token":1})"), "kd");
    auto r = d.applyJsonText(R"({"type":"keypress","charCode":97,"token":2})");
    requireOk(r, "kp");
    requireTrue(r.preventDefault, "keypress consumed");
    requireOk(d.applyJsonText(R"({"type":"keyup","keyCode":65,"key":"a","token":3})"), "ku");
    requireTrue(log.size() == 2 && log.commands()[0] == "kd,97" && log.commands()[1] == "ku,97",
                "kd/ku pair");

    r = d.applyJsonText(R"({"type":"keyup","keyCode":65,"key":"a","token":3})");
    requireTrue(!r.ok && r.err.code == "DUPLICATE_TOKEN", "duplicate token");

    r = d.applyJsonText(R"({"type":"keypress"})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "keypress needs a code");
    r = d.applyJsonText(R"({"type":"keydown","ctrlKey":true})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "keydown needs a key");

    requireOk(d.applyJsonText(R"({"type":"keydown","keyCode":16,"key":"Shift","location":2,"shiftKey":true})"),
              "right shift");
    requireTrue(log.back() == "kd,65506", "location honoured");
    requireOk(d.applyJsonText(R"({"type":"blur"})"), "blur");
    requireTrue(log.commands()[log.size() - 2] == "kr" && log.back() == "ku,65506",
                "blur resets keyboard");

    std::printf("  Test 2 (keyboard) PASS\n");
  }

  // --- Test 3: pointer routing ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    EventDispatcher d(s, &timers);
    d.applyJsonText(R"({"type":"attach"})");
    requireOk(d.applyJsonText(kResize), "resize");

    requireOk(d.applyJsonText(R"({"type":"mousemove","clientX":12,"clientY":34})"), "move");
    requireTrue(log.back() == "m,12,34,0,0", "m");
    requireOk(d.applyJsonText(R"({"type":"mousedown","clientX":12,"clientY":34,"button":0})"), "down");
    requireTrue(log.back() == "m,12,34,1,0", "pressed");
    auto r = d.applyJsonText(R"({"type":"mouseup","clientX":12,"clientY":34})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "mouseup needs button");
    requireTrue(r.err.details == R"({"field":"button"})", "details name the field");
    requireOk(d.applyJsonText(R"({"type":"mouseup","clientX":12,"clientY":34,"button":0})"), "up");
    requireTrue(log.back() == "m,12,34,0,0", "released");

    r = d.applyJsonText(R"({"type":"wheel","deltaY":100})");
    requireOk(r, "wheel");
    requireTrue(r.preventDefault, "wheel consumed");
    requireTrue(log.back() == "m,12,34,0,1", "wheel release");
    r = d.applyJsonText(R"({"type":"wheel"})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "wheel needs deltaY");

    requireOk(d.applyJsonText(R"({"type":"pointerlockchange","locked":true})"), "lock");
    requireTrue(log.back() == "p,1", "p,1");
    requireOk(d.applyJsonText(R"({"type":"mousemove","movementX":3,"movementY":4})"), "rel");
    requireTrue(log.back() == "m2,3,4,0,0", "m2");

    r = d.applyJsonText(R"({"type":"contextmenu"})");
    requireTrue(r.ok && r.preventDefault, "context menu suppressed");

    std::printf("  Test 3 (pointer) PASS\n");
  }

  // --- Test 4: touch + timers ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    EventDispatcher d(s, &timers);
    d.applyJsonText(R"({"type":"attach"})");
    d.applyJsonText(kResize);

    requireOk(d.applyJsonText(
      R"({"type":"touchstart","timeStamp":0,"touches":[{"id":1,"clientX":40,"clientY":50}]})"),
      "touchstart");
    requireOk(d.applyJsonText(
      R"({"type":"touchend","timeStamp":80,"touches":[{"id":1,"clientX":40,"clientY":50}]})"),
      "touchend");
    requireTrue(log.back() == "m,40,50,1,0", "tap press");
    requireOk(d.applyJsonText(R"({"type":"advance","ms":20})"), "advance");
    requireTrue(log.back() == "m,40,50,0,0", "tap release after advance");

    auto r = d.applyJsonText(R"({"type":"touchmove"})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "touches required");
    r = d.applyJsonText(R"({"type":"advance"})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "ms required");

    EventDispatcher noTimers(s);
    r = noTimers.applyJsonText(R"({"type":"advance","ms":5})");
    requireTrue(!r.ok && r.err.code == "BAD_EVENT", "advance needs a timer queue");

    std::printf("  Test 4 (touch + advance) PASS\n");
  }

  // --- Test 5: composition, gamepad, detach ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    EventDispatcher d(s, &timers);
    d.applyJsonText(R"({"type":"attach"})");

    d.applyJsonText(R"({"type":"compositionstart"})");
    d.applyJsonText(R"({"type":"compositionupdate","data":"k"})");
    d.applyJsonText(R"({"type":"compositionend","data":"ok"})");
    requireTrue(log.count("co,start") == 1 && log.count("co,update,k") == 1 &&
                log.count("co,end,ok") == 1, "composition lifecycle");
    requireTrue(log.count("kd,111") == 1 && log.count("kd,107") == 1, "text typed");
    d.applyJsonText(R"({"type":"advance","ms":5})");
    requireTrue(log.count("ku,111") == 1 && log.count("ku,107") == 1, "released");
    log.clear();

    requireOk(d.applyJsonText(R"({"type":"gamepadconnected","index":0,"id":"Pad","axes":4,"buttons":17})"),
              "connect");
    requireTrue(log.back() == "js,c,0,UGFk,4,17", "js,c");
    requireOk(d.applyJsonText(R"({"type":"gamepadbutton","index":0,"button":1,"value":1})"), "button");
    requireTrue(log.back() == "js,b,0,1,1", "js,b");
    requireOk(d.applyJsonText(R"({"type":"gamepadaxis","index":0,"axis":2,"value":-0.5})"), "axis");
    requireTrue(log.back() == "js,a,0,2,-0.5", "js,a");
    auto r = d.applyJsonText(R"({"type":"gamepadaxis","index":0,"axis":2})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "value required");
    r = d.applyJsonText(R"({"type":"gamepadbutton","button":1,"value":1})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_MISSING_FIELD", "index required");
    requireOk(d.applyJsonText(R"({"type":"gamepaddisconnected","index":0})"), "disconnect");
    requireTrue(log.back() == "js,d,0", "js,d");

    std::uint64_t applied = d.appliedCount();
    requireOk(d.applyJsonText(R"({"type":"detach"})"), "detach");
    requireTrue(log.back() == "p,0" && !s.attached(), "detached");
    requireTrue(d.appliedCount() == applied + 1, "counted");

    std::printf("  Test 5 (composition + gamepad) PASS\n");
  }

  // --- Test 6: out-of-range numbers ---
  {
    CommandLog log;
    TimerQueue timers;
    InputSession s(log, timers);
    EventDispatcher d(s, &timers);
    d.applyJsonText(R"({"type":"attach"})");
    requireOk(d.applyJsonText(kResize), "resize");
    log.clear();

    auto r = d.applyJsonText(R"({"type":"keydown","keyCode":1e300,"key":"a"})");
    requireTrue(!r.ok && r.err.code == "BAD_EVENT", "huge keyCode");
    requireTrue(r.err.details == R"({"field":"keyCode"})", "details name the field");
    r = d.applyJsonText(R"({"type":"keypress","charCode":-3e10})");
    requireTrue(!r.ok && r.err.details == R"({"field":"charCode"})", "huge charCode");
    r = d.applyJsonText(R"({"type":"keydown","keyCode":65,"key":"a","location":4294967296})");
    requireTrue(!r.ok && r.err.details == R"({"field":"location"})", "huge location");
    r = d.applyJsonText(R"({"type":"mousemove","clientX":1e200,"clientY":5})");
    requireTrue(!r.ok && r.err.details == R"({"field":"clientX"})", "huge clientX");
    r = d.applyJsonText(R"({"type":"wheel","deltaY":-1e12})");
    requireTrue(!r.ok && r.err.details == R"({"field":"deltaY"})", "huge deltaY");
    r = d.applyJsonText(R"({"type":"touchstart","touches":[{"id":0,"clientX":1,"clientY":1e9}]})");
    requireTrue(!r.ok && r.err.details == R"({"field":"clientY"})", "huge touch point");
    r = d.applyJsonText(R"({"type":"gamepadconnected","index":0,"id":"Pad","axes":1e100,"buttons":1})");
    requireTrue(!r.ok && r.err.details == R"({"field":"axes"})", "huge axis count");
    r = d.applyJsonText(R"({"type":"resize","element":{"width":800,"height":600},"canvasWidth":1e300})");
    requireTrue(!r.ok && r.err.details == R"({"field":"canvasWidth"})", "huge canvas");

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("type", "keydown", doc.GetAllocator());
    doc.AddMember("key", "a", doc.GetAllocator());
    doc.AddMember("keyCode", std::numeric_limits<double>::quiet_NaN(), doc.GetAllocator());
    r = d.applyJson(doc);
    requireTrue(!r.ok && r.err.code == "BAD_EVENT", "NaN keyCode");

    requireTrue(log.empty(), "nothing reached the wire");
    requireTrue(s.geometry().canvasWidth == 800, "rejected resize left geometry alone");

    requireOk(d.applyJsonText(R"({"type":"keydown","keyCode":13,"key":"Enter","location":0})"),
              "in-range event still applies");
    requireTrue(log.size() == 1 && log.back() == "kd,65293", "kd Enter");

    std::printf("  Test 6 (out-of-range numbers) PASS\n");
  }

  std::printf("D5.3 dispatcher: ALL PASS\n");
  return 0;
}
