#pragma once
#include "ri/protocol/CommandSink.hpp"
#include "ri/transport/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

namespace ri {

struct WebSocketTransportConfig {
  std::string url;                  // ws://host:port/path
  int reconnectIntervalMs{3000};    // auto-reconnect delay
  std::size_t maxQueueSize{1024};   // pending outbound commands
  std::size_t maxInboundSize{256};  // pending inbound text messages
};

// CommandSink that ships each command as one text frame. A worker thread owns
// the socket; send() only enqueues. Commands queued while disconnected are
// delivered after the next successful connect.
class WebSocketTransport : public CommandSink {
public:
  explicit WebSocketTransport(const WebSocketTransportConfig& config);
  ~WebSocketTransport() override;

  void start();
  void stop();
  bool isRunning() const;

  void send(const std::string& command) override;

  // Text messages received from the remote side.
  bool pollIncoming(std::string& message);

  enum class Status { disconnected, connecting, connected, error };
  Status status() const;

  std::size_t pendingCount() const { return outbound_.size(); }
  std::uint64_t droppedCount() const { return outbound_.droppedCount(); }

private:
  void ioLoop();
  void waitReconnect();

  WebSocketTransportConfig config_;
  ThreadSafeQueue<std::string> outbound_;
  ThreadSafeQueue<std::string> inbound_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<Status> status_{Status::disconnected};
};

} // namespace ri
