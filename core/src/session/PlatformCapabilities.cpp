#include "ri/session/PlatformCapabilities.hpp"

namespace ri {

std::vector<std::string> fullscreenLockedKeys() {
  return {"AltLeft", "AltRight", "Tab", "Escape", "MetaLeft", "MetaRight", "ContextMenu"};
}

} // namespace ri
