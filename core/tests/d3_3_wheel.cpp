// D3.3 - Wheel smoothing
// Tests: first event scrolls immediately, throttle window, trackpad burst
// detection disables throttling, adaptive tick magnitude with clamp,
// direction to button mapping, reset.

#include "ri/pointer/PointerMapper.hpp"
#include "ri/pointer/WheelSmoother.hpp"
#include "ri/protocol/CommandEncoder.hpp"
#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TimerQueue.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  using namespace ri;

  // --- Test 1: throttled mouse wheel ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    PointerMapper pointer(enc);
    WheelSmoother wheel(pointer, timers);

    requireTrue(wheel.wheel(30), "wheel always suppresses default");
    requireTrue(log.size() == 2, "first event scrolls");
    requireTrue(log.commands()[0] == "m,0,0,8,1" && log.commands()[1] == "m,0,0,0,1",
                "scroll down is button 3");
    requireTrue(!wheel.throttleOpen(), "window closed");

    timers.advanceBy(50);
    wheel.wheel(-10);
    requireTrue(log.size() == 2, "throttled inside the window");

    timers.advanceBy(50);
    requireTrue(wheel.throttleOpen(), "window reopened at 100ms");
    wheel.wheel(-10);
    requireTrue(log.size() == 4, "scrolls again");
    requireTrue(log.commands()[2] == "m,0,0,16,1", "scroll up is button 4");

    std::printf("  Test 1 (throttle) PASS\n");
  }

  // --- Test 2: non-burst window keeps throttling ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    PointerMapper pointer(enc);
    WheelSmoother wheel(pointer, timers);

    wheel.wheel(10);
    wheel.wheel(20);
    wheel.wheel(30);
    wheel.wheel(40);
    requireTrue(wheel.throttling(), "small varied deltas are not a burst");
    requireTrue(log.size() == 2, "only the first scrolled");

    std::printf("  Test 2 (no burst) PASS\n");
  }

  // --- Test 3: trackpad burst passes through ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    PointerMapper pointer(enc);
    WheelSmoother wheel(pointer, timers);

    wheel.wheel(120);
    wheel.wheel(120);
    wheel.wheel(120);
    requireTrue(log.size() == 2, "throttled before the window fills");
    wheel.wheel(120);
    requireTrue(!wheel.throttling(), "burst detected");
    requireTrue(log.size() == 4, "burst sample emitted");

    wheel.wheel(120);
    wheel.wheel(360);
    requireTrue(log.size() == 8, "every burst sample emitted");
    requireTrue(log.commands()[6] == "m,0,0,8,3", "magnitude relative to smallest delta");

    wheel.wheel(2400);
    requireTrue(log.back() == "m,0,0,0,10", "ticks clamped to 10");
    requireTrue(wheel.smallestDelta() == 120, "smallest tracked");

    std::printf("  Test 3 (burst) PASS\n");
  }

  // --- Test 4: pointer position and reset ---
  {
    CommandLog log;
    CommandEncoder enc(log);
    TimerQueue timers;
    PointerMapper pointer(enc);
    pointer.frame().setElementRect({0, 0, 800, 600});
    pointer.frame().setCanvasSize(800, 600);
    pointer.moveTo(400, 300);
    WheelSmoother wheel(pointer, timers);

    wheel.wheel(100);
    requireTrue(log.commands()[0] == "m,400,300,8,1", "scroll at the pointer");

    wheel.reset();
    requireTrue(wheel.throttleOpen() && wheel.throttling(), "reset reopens");
    requireTrue(timers.pending() == 0, "throttle timer cancelled");
    wheel.wheel(100);
    requireTrue(log.size() == 4, "scrolls right after reset");

    std::printf("  Test 4 (position + reset) PASS\n");
  }

  std::printf("D3.3 wheel: ALL PASS\n");
  return 0;
}
