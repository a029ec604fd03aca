#pragma once

namespace ri {

// Modifier flags carried by a key event, or last sent to the remote side.
// hyper covers the OS / Super / Win key.
struct ModifierState {
  bool shift{false};
  bool ctrl{false};
  bool alt{false};
  bool meta{false};
  bool hyper{false};

  bool any() const { return shift || ctrl || alt || meta || hyper; }

  bool operator==(const ModifierState& o) const {
    return shift == o.shift && ctrl == o.ctrl && alt == o.alt &&
           meta == o.meta && hyper == o.hyper;
  }
  bool operator!=(const ModifierState& o) const { return !(*this == o); }
};

} // namespace ri
