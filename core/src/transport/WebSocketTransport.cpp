#include "ri/transport/WebSocketTransport.hpp"
#include <easywsclient/easywsclient.hpp>

#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>

namespace ri {

WebSocketTransport::WebSocketTransport(const WebSocketTransportConfig& config)
    : config_(config), outbound_(config.maxQueueSize), inbound_(config.maxInboundSize) {}

WebSocketTransport::~WebSocketTransport() { stop(); }

void WebSocketTransport::start() {
  if (running_.load()) return;
  running_.store(true);
  status_.store(Status::connecting);
  thread_ = std::thread(&WebSocketTransport::ioLoop, this);
}

void WebSocketTransport::stop() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
  status_.store(Status::disconnected);
}

bool WebSocketTransport::isRunning() const { return running_.load(); }

WebSocketTransport::Status WebSocketTransport::status() const {
  return status_.load();
}

void WebSocketTransport::send(const std::string& command) {
  if (!outbound_.push(command)) {
    std::fprintf(stderr, "[WebSocketTransport] outbound queue full, dropped oldest\n");
  }
}

bool WebSocketTransport::pollIncoming(std::string& message) {
  return inbound_.pop(message);
}

void WebSocketTransport::waitReconnect() {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.reconnectIntervalMs);
  while (running_.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

void WebSocketTransport::ioLoop() {
  while (running_.load()) {
    status_.store(Status::connecting);
    std::fprintf(stderr, "[WebSocketTransport] connecting to %s\n",
                 config_.url.c_str());

    std::unique_ptr<easywsclient::WebSocket,
                     void (*)(easywsclient::WebSocket*)>
        ws(easywsclient::WebSocket::from_url(config_.url),
           [](easywsclient::WebSocket* p) {
             if (p && p != easywsclient::WebSocket::create_dummy()) delete p;
           });

    if (!ws || ws->getReadyState() == easywsclient::WebSocket::CLOSED) {
      std::fprintf(stderr,
                   "[WebSocketTransport] connection failed, retrying in %dms\n",
                   config_.reconnectIntervalMs);
      status_.store(Status::error);
      waitReconnect();
      continue;
    }

    status_.store(Status::connected);
    std::fprintf(stderr, "[WebSocketTransport] connected\n");

    while (running_.load() &&
           ws->getReadyState() != easywsclient::WebSocket::CLOSED) {
      std::string cmd;
      while (outbound_.pop(cmd)) ws->send(cmd);

      ws->poll(10); // 10ms poll timeout
      ws->dispatch([this](const std::string& msg) {
        inbound_.push(msg);
      });
    }

    if (ws->getReadyState() != easywsclient::WebSocket::CLOSED) {
      ws->close();
      ws->poll(0);
    }

    if (running_.load()) {
      std::fprintf(stderr,
                   "[WebSocketTransport] disconnected, reconnecting in %dms\n",
                   config_.reconnectIntervalMs);
      status_.store(Status::error);
      waitReconnect();
    }
  }

  status_.store(Status::disconnected);
}

} // namespace ri
