#pragma once
#include <cstddef>
#include <map>
#include <string>

namespace ri {

class CommandEncoder;

struct GamepadInfo {
  std::string name;
  int axisCount{0};
  int buttonCount{0};
};

// Relays an external sampler's gamepad notifications. The only state is the
// association of a gamepad index with its declared layout.
class GamepadBridge {
public:
  explicit GamepadBridge(CommandEncoder& encoder) : encoder_(encoder) {}

  // Re-connecting a known index replaces its layout.
  void connect(int index, const std::string& name, int axisCount, int buttonCount);
  void disconnect(int index);

  // Values for unknown indexes or out-of-range inputs are dropped.
  bool button(int index, int button, double value);
  bool axis(int index, int axis, double value);

  // Forget every pad, announcing each disconnect.
  void disconnectAll();

  bool isConnected(int index) const { return pads_.count(index) != 0; }
  const GamepadInfo* info(int index) const;
  std::size_t connectedCount() const { return pads_.size(); }

private:
  CommandEncoder& encoder_;
  std::map<int, GamepadInfo> pads_;
};

} // namespace ri
