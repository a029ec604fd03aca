#include "ri/keyboard/KeyEvent.hpp"

#include <cctype>
#include <string>

namespace ri {

static std::string lowered(const std::string& s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

KeyboardQuirks KeyboardQuirks::forPlatform(const std::string& platform) {
  KeyboardQuirks q;
  const std::string p = lowered(platform);

  if (p.find("ipad") != std::string::npos ||
      p.find("iphone") != std::string::npos ||
      p.find("ipod") != std::string::npos) {
    q.keyupUnreliable = true;
  } else if (p.rfind("mac", 0) == 0) {
    q.altIsTypableOnly = true;
    q.capsLockKeyupUnreliable = true;
  }
  return q;
}

} // namespace ri
