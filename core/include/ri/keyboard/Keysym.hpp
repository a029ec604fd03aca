#pragma once
#include <cstdint>
#include <string>

namespace ri {

// X11-style keysym as understood by the remote side.
using Keysym = std::uint32_t;

// Never produced by the resolver (codepoint 0 maps to 0xFF00).
inline constexpr Keysym kNoKeysym = 0;

// DOM key location.
enum class KeyLocation : std::uint8_t {
  Standard = 0, Left = 1, Right = 2, Numpad = 3
};

// Tri-state shift heuristic applied to typed characters.
enum class ShiftHint : std::uint8_t {
  Unknown = 0, Shifted, Unshifted
};

namespace keysyms {
inline constexpr Keysym AltGr     = 0xFE03; // ISO Level 3 Shift
inline constexpr Keysym ShiftL    = 0xFFE1;
inline constexpr Keysym ShiftR    = 0xFFE2;
inline constexpr Keysym CtrlL     = 0xFFE3;
inline constexpr Keysym CtrlR     = 0xFFE4;
inline constexpr Keysym CapsLock  = 0xFFE5;
inline constexpr Keysym MetaL     = 0xFFE7;
inline constexpr Keysym MetaR     = 0xFFE8;
inline constexpr Keysym AltL      = 0xFFE9;
inline constexpr Keysym AltR      = 0xFFEA;
inline constexpr Keysym SuperL    = 0xFFEB;
inline constexpr Keysym SuperR    = 0xFFEC;
} // namespace keysyms

// Non-typable keycode table, location-aware (numpad variants for navigation keys).
Keysym keysymFromKeyCode(int keyCode, KeyLocation location);

// DOM3 key value or legacy keyIdentifier ("U+0041", "a", "ArrowLeft", ...).
// Single characters and U+ escapes are case-adjusted by the shift hint.
// Single characters on the numpad go through the named-key table instead.
Keysym keysymFromKeyIdentifier(const std::string& identifier,
                               KeyLocation location,
                               ShiftHint shift = ShiftHint::Unknown);

// Unicode codepoint -> keysym. Returns kNoKeysym outside the Unicode range.
Keysym keysymFromCodepoint(std::uint32_t codepoint);

// Full keydown derivation: DOM key, then keycode table, then a sane legacy
// identifier, then A-Z / 0-9 straight from the keycode. Shift hint applies to
// the legacy identifier and the keycode-derived letter.
Keysym resolveKeydownKeysym(int keyCode,
                            const std::string& key,
                            const std::string& keyIdentifier,
                            KeyLocation location,
                            ShiftHint shift);

// <= 0xFF or carrying the 0x01000000 Unicode marker.
bool isPrintableKeysym(Keysym keysym);

// Modifiers and lock keys never auto-repeat.
bool isNoRepeatKeysym(Keysym keysym);

bool isMetaKeysym(Keysym keysym);

// A-Z or a-z.
bool isLetterKeysym(Keysym keysym);

bool isControlCodepoint(std::uint32_t codepoint);

// Some browsers derive U+XXXX identifiers from the keycode itself, which is
// only right for A-Z and 0-9.
bool keyIdentifierSane(int keyCode, const std::string& keyIdentifier);

} // namespace ri
