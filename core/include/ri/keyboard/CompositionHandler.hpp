#pragma once
#include "ri/keyboard/Keysym.hpp"
#include "ri/sched/TaskScheduler.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace ri {

class CommandEncoder;
class KeyboardReconciler;

struct CompositionConfig {
  double releaseDelayMs{5};  // press -> release gap for each composed character
};

// IME lifecycle. Finished text is forwarded as co,end and then typed out
// through the reconciler's press/release primitives.
class CompositionHandler {
public:
  CompositionHandler(CommandEncoder& encoder, KeyboardReconciler& keyboard,
                     TaskScheduler& scheduler);
  ~CompositionHandler();

  CompositionHandler(const CompositionHandler&) = delete;
  CompositionHandler& operator=(const CompositionHandler&) = delete;

  void setConfig(const CompositionConfig& cfg) { config_ = cfg; }

  void start();
  void update(const std::string& data);
  void end(const std::string& data);

  // Drop an in-flight composition and any pending releases.
  void cancel();

  bool isComposing() const { return composing_; }
  const std::string& text() const { return text_; }

  // Press and release every codepoint of a UTF-8 string.
  void typeString(const std::string& utf8);

private:
  CommandEncoder& encoder_;
  KeyboardReconciler& keyboard_;
  TaskScheduler& sched_;
  CompositionConfig config_;

  bool composing_{false};
  std::string text_;
  std::uint64_t nextRelease_{1};
  std::unordered_map<std::uint64_t, TaskId> releaseTasks_;
};

} // namespace ri
