#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace ri {

// Receives encoded wire commands, one per call, in emission order.
class CommandSink {
public:
  virtual ~CommandSink() = default;
  virtual void send(const std::string& command) = 0;
};

// In-memory sink for tests and replay.
class CommandLog : public CommandSink {
public:
  void send(const std::string& command) override { commands_.push_back(command); }

  const std::vector<std::string>& commands() const { return commands_; }
  std::size_t size() const { return commands_.size(); }
  bool empty() const { return commands_.empty(); }
  const std::string& back() const { return commands_.back(); }
  void clear() { commands_.clear(); }

  // Number of commands equal to `command`.
  std::size_t count(const std::string& command) const {
    std::size_t n = 0;
    for (const auto& c : commands_) if (c == command) n++;
    return n;
  }

  // Number of commands starting with `prefix`.
  std::size_t countPrefix(const std::string& prefix) const {
    std::size_t n = 0;
    for (const auto& c : commands_) {
      if (c.compare(0, prefix.size(), prefix) == 0) n++;
    }
    return n;
  }

private:
  std::vector<std::string> commands_;
};

} // namespace ri
