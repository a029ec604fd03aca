#pragma once
#include <string>
#include <vector>

namespace ri {

// Optional host facilities. The session only requests what the host
// reports it has; a request that then fails is logged and input carries on
// in non-captured mode. The default implementation has nothing.
class PlatformCapabilities {
public:
  virtual ~PlatformCapabilities() = default;

  virtual bool hasPointerLock() const { return false; }
  virtual bool hasKeyboardLock() const { return false; }
  virtual bool hasFullscreen() const { return false; }

  virtual bool requestPointerLock() { return false; }
  virtual void exitPointerLock() {}

  // `codes` are physical key codes ("AltLeft", "Tab", ...).
  virtual bool requestKeyboardLock(const std::vector<std::string>& codes) {
    (void)codes;
    return false;
  }
  virtual void releaseKeyboardLock() {}

  virtual bool requestFullscreen() { return false; }
};

// Keys captured while fullscreen so that system shortcuts reach the remote.
std::vector<std::string> fullscreenLockedKeys();

} // namespace ri
