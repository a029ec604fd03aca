// Event replay tool for RemoteInput
// Reads newline-delimited JSON events (stdin or --in <file>), runs them
// through EventDispatcher + InputSession and prints the wire commands.
//   --config <file>  load an InputConfig
//   --ws <url>       also forward commands over a WebSocket (if RI_HAS_WEBSOCKET)
// Time only moves on {"type":"advance","ms":N} events.

#include "ri/dispatch/EventDispatcher.hpp"
#include "ri/protocol/CommandSink.hpp"
#include "ri/sched/TimerQueue.hpp"
#include "ri/session/InputConfig.hpp"
#include "ri/session/InputSession.hpp"

#ifdef RI_HAS_WEBSOCKET
#include "ri/transport/WebSocketTransport.hpp"
#endif

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Prints every command and optionally forwards it.
class PrintingSink : public ri::CommandSink {
public:
  explicit PrintingSink(ri::CommandSink* next) : next_(next) {}

  void send(const std::string& command) override {
    std::printf("%s\n", command.c_str());
    if (next_) next_->send(command);
  }

private:
  ri::CommandSink* next_;
};

int main(int argc, char* argv[]) {
  std::string wsUrl;
  std::string configPath;
  std::string inPath;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--ws" && i + 1 < argc) {
      wsUrl = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--in" && i + 1 < argc) {
      inPath = argv[++i];
    } else {
      std::fprintf(stderr, "usage: %s [--in events.jsonl] [--config cfg.json] [--ws url]\n", argv[0]);
      return 2;
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
#else
  if (!wsUrl.empty()) {
    std::fprintf(stderr, "replay_events: built without WebSocket support, ignoring --ws\n");
  }
#endif

  PrintingSink sink(forward);
  ri::TimerQueue timers;
  ri::InputSession session(sink, timers);
  session.setConfig(cfg);
  session.attach();

  ri::EventDispatcher dispatcher(session, &timers);

  std::ifstream file;
  if (!inPath.empty()) {
    file.open(inPath);
    if (!file) {
      std::fprintf(stderr, "replay_events: cannot open %s\n", inPath.c_str());
      return 1;
    }
  }
  std::istream& in = inPath.empty() ? std::cin : file;

  int lineNo = 0;
  int failures = 0;
  std::string line;
  while (std::getline(in, line)) {
    lineNo++;
    if (line.empty() || line[0] == '#') continue;

    ri::DispatchResult r = dispatcher.applyJsonText(line);
    if (!r.ok) {
      failures++;
      std::fprintf(stderr, "line %d: %s: %s %s\n", lineNo,
                   r.err.code.c_str(), r.err.message.c_str(), r.err.details.c_str());
    }
  }

  session.detach();

#ifdef RI_HAS_WEBSOCKET
  if (transport) {
    // Give the worker a moment to flush.
    for (int i = 0; i < 100 && transport->pendingCount() > 0; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    transport->stop();
  }
#endif

  std::fprintf(stderr, "replay_events: %llu events, %d rejected, %llu commands\n",
               static_cast<unsigned long long>(dispatcher.appliedCount()),
               failures,
               static_cast<unsigned long long>(session.encoder().sentCount()));
  return failures == 0 ? 0 : 1;
}
