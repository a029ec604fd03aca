// Native input client for RemoteInput
// Opens a GLFW window and forwards its keyboard, mouse, wheel and gamepad
// input as wire commands. Commands are printed, and sent over a WebSocket
// with --ws ws://host:port (if RI_HAS_WEBSOCKET).
//   --config <file>      load an InputConfig
//   --canvas <w>x<h>     remote canvas size (default: window framebuffer)
// Ctrl+Shift+click locks the pointer, Ctrl+Shift+F goes fullscreen,
// Ctrl+Shift+M prints the session state.

#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TimerQueue.hpp"
#include "ri/session/InputConfig.hpp"
#include "ri/session/InputSession.hpp"

#ifdef RI_HAS_WEBSOCKET
#include "ri/transport/WebSocketTransport.hpp"
#endif

#ifdef RI_HAS_GLFW
#include "ri/glfw/GlfwInputSource.hpp"
#endif

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

class PrintingSink : public ri::CommandSink {
public:
  explicit PrintingSink(ri::CommandSink* next) : next_(next) {}

  void send(const std::string& command) override {
    std::printf("%s\n", command.c_str());
    std::fflush(stdout);
    if (next_) next_->send(command);
  }

private:
  ri::CommandSink* next_;
};

int main(int argc, char* argv[]) {
#ifndef RI_HAS_GLFW
  (void)argc;
  (void)argv;
  std::fprintf(stderr, "glfw_client: built without GLFW\n");
  return 1;
#else
  constexpr int W = 1280, H = 720;

  // Parse args
  std::string wsUrl;
  std::string configPath;
  int canvasW = 0, canvasH = 0;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--ws" && i + 1 < argc) {
      wsUrl = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--canvas" && i + 1 < argc) {
      if (std::sscanf(argv[++i], "%dx%d", &canvasW, &canvasH) != 2) {
        std::fprintf(stderr, "glfw_client: bad --canvas value\n");
        return 2;
      }
    }
  }

  ri::InputConfig cfg;
  if (!configPath.empty() && !ri::loadInputConfigFile(configPath, cfg)) return 1;

  ri::CommandSink* forward = nullptr;
#ifdef RI_HAS_WEBSOCKET
  std::unique_ptr<ri::WebSocketTransport> transport;
  if (!wsUrl.empty()) {
    ri::WebSocketTransportConfig tcfg;
    tcfg.url = wsUrl;
    transport = std::make_unique<ri::WebSocketTransport>(tcfg);
    transport->start();
    forward = transport.get();
  }
#endif

  PrintingSink sink(forward);
  ri::TimerQueue timers;
  ri::InputSession session(sink, timers);
  session.setConfig(cfg);

  ri::GlfwInputSource source(session);
  if (!source.init(W, H, "RemoteInput")) return 1;
  session.setCapabilities(&source);
  if (canvasW > 0 && canvasH > 0) source.setCanvasSize(canvasW, canvasH);

  session.setMenuHotkeyCallback([&session]() {
    std::fprintf(stderr, "[glfw_client] keys held: %zu, button mask: %d\n",
                 session.keyboard().pressedCount(), session.pointer().buttonMask());
  });

  session.attach();

  while (source.poll()) {
    timers.advanceTo(source.nowMs());
#ifdef RI_HAS_WEBSOCKET
    if (transport) {
      std::string msg;
      while (transport->pollIncoming(msg)) {
        std::fprintf(stderr, "[glfw_client] remote: %s\n", msg.c_str());
      }
    }
#endif
    std::this_thread::sleep_for(std::chrono::milliseconds(4));
  }

  session.setCapabilities(nullptr);
  session.detach();
  return 0;
#endif
}
