#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ri {

inline constexpr std::uint32_t kReplacementCodepoint = 0xFFFD;

// Decode UTF-8 into codepoints. Malformed sequences, overlong forms and
// UTF-16 surrogates decode to U+FFFD and consume one byte.
inline std::vector<std::uint32_t> decodeUtf8(const std::string& text) {
  std::vector<std::uint32_t> out;
  out.reserve(text.size());

  std::size_t i = 0;
  const std::size_t n = text.size();
  while (i < n) {
    auto b0 = static_cast<std::uint8_t>(text[i]);
    std::uint32_t cp = 0;
    std::size_t len = 0;

    std::uint32_t minCp = 0;

    if (b0 < 0x80)                { cp = b0;        len = 1; }
    else if ((b0 & 0xE0) == 0xC0) { cp = b0 & 0x1F; len = 2; minCp = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { cp = b0 & 0x0F; len = 3; minCp = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { cp = b0 & 0x07; len = 4; minCp = 0x10000; }
    else {
      out.push_back(kReplacementCodepoint);
      i++;
      continue;
    }

    if (i + len > n) {
      out.push_back(kReplacementCodepoint);
      i++;
      continue;
    }

    bool ok = true;
    for (std::size_t k = 1; k < len; k++) {
      auto b = static_cast<std::uint8_t>(text[i + k]);
      if ((b & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (b & 0x3F);
    }

    bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
    if (!ok || cp < minCp || cp > 0x10FFFF || surrogate) {
      out.push_back(kReplacementCodepoint);
      i++;
      continue;
    }

    out.push_back(cp);
    i += len;
  }
  return out;
}

} // namespace ri
