#include "ri/keyboard/CompositionHandler.hpp"
#include "ri/keyboard/KeyboardReconciler.hpp"
#include "ri/keyboard/Utf8.hpp"
#include "ri/protocol/CommandEncoder.hpp"

namespace ri {

CompositionHandler::CompositionHandler(CommandEncoder& encoder,
                                       KeyboardReconciler& keyboard,
                                       TaskScheduler& scheduler)
  : encoder_(encoder), keyboard_(keyboard), sched_(scheduler) {}

CompositionHandler::~CompositionHandler() {
  for (auto& t : releaseTasks_) sched_.cancel(t.second);
}

void CompositionHandler::start() {
  composing_ = true;
  text_.clear();
  encoder_.compositionStart();
}

void CompositionHandler::update(const std::string& data) {
  if (!composing_) return;
  if (!data.empty()) text_ = data;
  encoder_.compositionUpdate(text_);
}

void CompositionHandler::end(const std::string& data) {
  composing_ = false;
  if (!data.empty()) text_ = data;
  encoder_.compositionEnd(text_);

  if (!text_.empty()) typeString(text_);
  text_.clear();
}

void CompositionHandler::cancel() {
  for (auto& t : releaseTasks_) sched_.cancel(t.second);
  releaseTasks_.clear();
  composing_ = false;
  text_.clear();
}

void CompositionHandler::typeString(const std::string& utf8) {
  for (std::uint32_t cp : decodeUtf8(utf8)) {
    Keysym keysym = keysymFromCodepoint(cp);
    if (keysym == kNoKeysym) continue;

    // A repeated character must go up before it can go down again.
    if (keyboard_.isPressed(keysym)) keyboard_.release(keysym);
    if (!keyboard_.press(keysym)) continue;

    std::uint64_t seq = nextRelease_++;
    releaseTasks_[seq] = sched_.schedule(config_.releaseDelayMs, [this, keysym, seq]() {
      releaseTasks_.erase(seq);
      keyboard_.release(keysym);
    });
  }
}

} // namespace ri
