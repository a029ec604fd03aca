#include "ri/keyboard/Keysym.hpp"
#include "ri/keyboard/Utf8.hpp"

#include <array>
#include <string>
#include <unordered_map>

namespace ri {

namespace {

// Indexed by KeyLocation; 0 entries fall back to the Standard slot.
using LocatedKeysyms = std::array<Keysym, 4>;

const std::unordered_map<int, LocatedKeysyms>& keycodeTable() {
  static const std::unordered_map<int, LocatedKeysyms> table = {
    {8,   {0xFF08, 0, 0, 0}},                // backspace
    {9,   {0xFF09, 0, 0, 0}},                // tab
    {12,  {0xFF0B, 0xFF0B, 0xFF0B, 0xFFB5}}, // clear / KP 5
    {13,  {0xFF0D, 0, 0, 0}},                // enter
    {16,  {0xFFE1, 0xFFE1, 0xFFE2, 0}},      // shift
    {17,  {0xFFE3, 0xFFE3, 0xFFE4, 0}},      // ctrl
    {18,  {0xFFE9, 0xFFE9, 0xFFEA, 0}},      // alt
    {19,  {0xFF13, 0, 0, 0}},                // pause/break
    {20,  {0xFFE5, 0, 0, 0}},                // caps lock
    {27,  {0xFF1B, 0, 0, 0}},                // escape
    {32,  {0x0020, 0, 0, 0}},                // space
    {33,  {0xFF55, 0xFF55, 0xFF55, 0xFFB9}}, // page up / KP 9
    {34,  {0xFF56, 0xFF56, 0xFF56, 0xFFB3}}, // page down / KP 3
    {35,  {0xFF57, 0xFF57, 0xFF57, 0xFFB1}}, // end / KP 1
    {36,  {0xFF50, 0xFF50, 0xFF50, 0xFFB7}}, // home / KP 7
    {37,  {0xFF51, 0xFF51, 0xFF51, 0xFFB4}}, // left / KP 4
    {38,  {0xFF52, 0xFF52, 0xFF52, 0xFFB8}}, // up / KP 8
    {39,  {0xFF53, 0xFF53, 0xFF53, 0xFFB6}}, // right / KP 6
    {40,  {0xFF54, 0xFF54, 0xFF54, 0xFFB2}}, // down / KP 2
    {45,  {0xFF63, 0xFF63, 0xFF63, 0xFFB0}}, // insert / KP 0
    {46,  {0xFFFF, 0xFFFF, 0xFFFF, 0xFFAE}}, // delete / KP decimal
    {91,  {0xFFE7, 0, 0, 0}},                // left OS key (meta_l)
    {92,  {0xFFE8, 0, 0, 0}},                // right OS key (meta_r)
    {93,  {0xFF67, 0, 0, 0}},                // menu
    {96,  {0xFFB0, 0, 0, 0}},                // KP 0
    {97,  {0xFFB1, 0, 0, 0}},
    {98,  {0xFFB2, 0, 0, 0}},
    {99,  {0xFFB3, 0, 0, 0}},
    {100, {0xFFB4, 0, 0, 0}},
    {101, {0xFFB5, 0, 0, 0}},
    {102, {0xFFB6, 0, 0, 0}},
    {103, {0xFFB7, 0, 0, 0}},
    {104, {0xFFB8, 0, 0, 0}},
    {105, {0xFFB9, 0, 0, 0}},                // KP 9
    {106, {0xFFAA, 0, 0, 0}},                // KP multiply
    {107, {0xFFAB, 0, 0, 0}},                // KP add
    {109, {0xFFAD, 0, 0, 0}},                // KP subtract
    {110, {0xFFAE, 0, 0, 0}},                // KP decimal
    {111, {0xFFAF, 0, 0, 0}},                // KP divide
    {112, {0xFFBE, 0, 0, 0}},                // F1
    {113, {0xFFBF, 0, 0, 0}},
    {114, {0xFFC0, 0, 0, 0}},
    {115, {0xFFC1, 0, 0, 0}},
    {116, {0xFFC2, 0, 0, 0}},
    {117, {0xFFC3, 0, 0, 0}},
    {118, {0xFFC4, 0, 0, 0}},
    {119, {0xFFC5, 0, 0, 0}},
    {120, {0xFFC6, 0, 0, 0}},
    {121, {0xFFC7, 0, 0, 0}},
    {122, {0xFFC8, 0, 0, 0}},
    {123, {0xFFC9, 0, 0, 0}},                // F12
    {144, {0xFF7F, 0, 0, 0}},                // num lock
    {145, {0xFF14, 0, 0, 0}},                // scroll lock
    {225, {0xFE03, 0, 0, 0}},                // AltGraph
  };
  return table;
}

const std::unordered_map<std::string, LocatedKeysyms>& namedKeyTable() {
  static const std::unordered_map<std::string, LocatedKeysyms> table = {
    {"Again",                {0xFF66, 0, 0, 0}},
    {"AllCandidates",        {0xFF3D, 0, 0, 0}},
    {"Alphanumeric",         {0xFF30, 0, 0, 0}},
    {"Alt",                  {0xFFE9, 0xFFE9, 0xFFEA, 0}},
    {"Attn",                 {0xFD0E, 0, 0, 0}},
    {"AltGraph",             {0xFE03, 0, 0, 0}},
    {"ArrowDown",            {0xFF54, 0, 0, 0}},
    {"ArrowLeft",            {0xFF51, 0, 0, 0}},
    {"ArrowRight",           {0xFF53, 0, 0, 0}},
    {"ArrowUp",              {0xFF52, 0, 0, 0}},
    {"Backspace",            {0xFF08, 0, 0, 0}},
    {"CapsLock",             {0xFFE5, 0, 0, 0}},
    {"Cancel",               {0xFF69, 0, 0, 0}},
    {"Clear",                {0xFF0B, 0, 0, 0}},
    {"Convert",              {0xFF23, 0, 0, 0}},
    {"Copy",                 {0xFD15, 0, 0, 0}},
    {"Crsel",                {0xFD1C, 0, 0, 0}},
    {"CrSel",                {0xFD1C, 0, 0, 0}},
    {"CodeInput",            {0xFF37, 0, 0, 0}},
    {"Compose",              {0xFF20, 0, 0, 0}},
    {"Control",              {0xFFE3, 0xFFE3, 0xFFE4, 0}},
    {"ContextMenu",          {0xFF67, 0, 0, 0}},
    {"Delete",               {0xFFFF, 0, 0, 0}},
    {"Down",                 {0xFF54, 0, 0, 0}},
    {"End",                  {0xFF57, 0, 0, 0}},
    {"Enter",                {0xFF0D, 0, 0, 0}},
    {"EraseEof",             {0xFD06, 0, 0, 0}},
    {"Escape",               {0xFF1B, 0, 0, 0}},
    {"Execute",              {0xFF62, 0, 0, 0}},
    {"Exsel",                {0xFD1D, 0, 0, 0}},
    {"ExSel",                {0xFD1D, 0, 0, 0}},
    {"F1",                   {0xFFBE, 0, 0, 0}},
    {"F2",                   {0xFFBF, 0, 0, 0}},
    {"F3",                   {0xFFC0, 0, 0, 0}},
    {"F4",                   {0xFFC1, 0, 0, 0}},
    {"F5",                   {0xFFC2, 0, 0, 0}},
    {"F6",                   {0xFFC3, 0, 0, 0}},
    {"F7",                   {0xFFC4, 0, 0, 0}},
    {"F8",                   {0xFFC5, 0, 0, 0}},
    {"F9",                   {0xFFC6, 0, 0, 0}},
    {"F10",                  {0xFFC7, 0, 0, 0}},
    {"F11",                  {0xFFC8, 0, 0, 0}},
    {"F12",                  {0xFFC9, 0, 0, 0}},
    {"F13",                  {0xFFCA, 0, 0, 0}},
    {"F14",                  {0xFFCB, 0, 0, 0}},
    {"F15",                  {0xFFCC, 0, 0, 0}},
    {"F16",                  {0xFFCD, 0, 0, 0}},
    {"F17",                  {0xFFCE, 0, 0, 0}},
    {"F18",                  {0xFFCF, 0, 0, 0}},
    {"F19",                  {0xFFD0, 0, 0, 0}},
    {"F20",                  {0xFFD1, 0, 0, 0}},
    {"F21",                  {0xFFD2, 0, 0, 0}},
    {"F22",                  {0xFFD3, 0, 0, 0}},
    {"F23",                  {0xFFD4, 0, 0, 0}},
    {"F24",                  {0xFFD5, 0, 0, 0}},
    {"Find",                 {0xFF68, 0, 0, 0}},
    {"GroupFirst",           {0xFE0C, 0, 0, 0}},
    {"GroupLast",            {0xFE0E, 0, 0, 0}},
    {"GroupNext",            {0xFE08, 0, 0, 0}},
    {"GroupPrevious",        {0xFE0A, 0, 0, 0}},
    {"HangulMode",           {0xFF31, 0, 0, 0}},
    {"Hankaku",              {0xFF29, 0, 0, 0}},
    {"HanjaMode",            {0xFF34, 0, 0, 0}},
    {"Help",                 {0xFF6A, 0, 0, 0}},
    {"Hiragana",             {0xFF25, 0, 0, 0}},
    {"HiraganaKatakana",     {0xFF27, 0, 0, 0}},
    {"Home",                 {0xFF50, 0, 0, 0}},
    {"Hyper",                {0xFFED, 0xFFED, 0xFFEE, 0}},
    {"Insert",               {0xFF63, 0, 0, 0}},
    {"JapaneseHiragana",     {0xFF25, 0, 0, 0}},
    {"JapaneseKatakana",     {0xFF26, 0, 0, 0}},
    {"JapaneseRomaji",       {0xFF24, 0, 0, 0}},
    {"JunjaMode",            {0xFF38, 0, 0, 0}},
    {"KanaMode",             {0xFF2D, 0, 0, 0}},
    {"KanjiMode",            {0xFF21, 0, 0, 0}},
    {"Katakana",             {0xFF26, 0, 0, 0}},
    {"Left",                 {0xFF51, 0, 0, 0}},
    {"Meta",                 {0xFFE7, 0xFFE7, 0xFFE8, 0}},
    {"ModeChange",           {0xFF7E, 0, 0, 0}},
    {"NonConvert",           {0xFF22, 0, 0, 0}},
    {"NumLock",              {0xFF7F, 0, 0, 0}},
    {"PageDown",             {0xFF56, 0, 0, 0}},
    {"PageUp",               {0xFF55, 0, 0, 0}},
    {"Pause",                {0xFF13, 0, 0, 0}},
    {"Play",                 {0xFD16, 0, 0, 0}},
    {"PreviousCandidate",    {0xFF3E, 0, 0, 0}},
    {"PrintScreen",          {0xFF61, 0, 0, 0}},
    {"Redo",                 {0xFF66, 0, 0, 0}},
    {"Right",                {0xFF53, 0, 0, 0}},
    {"Romaji",               {0xFF24, 0, 0, 0}},
    {"Scroll",               {0xFF14, 0, 0, 0}},
    {"ScrollLock",           {0xFF14, 0, 0, 0}},
    {"Select",               {0xFF60, 0, 0, 0}},
    {"Separator",            {0xFFAC, 0, 0, 0}},
    {"Shift",                {0xFFE1, 0xFFE1, 0xFFE2, 0}},
    {"SingleCandidate",      {0xFF3C, 0, 0, 0}},
    {"Super",                {0xFFEB, 0xFFEB, 0xFFEC, 0}},
    {"Tab",                  {0xFF09, 0, 0, 0}},
    {"UIKeyInputDownArrow",  {0xFF54, 0, 0, 0}},
    {"UIKeyInputEscape",     {0xFF1B, 0, 0, 0}},
    {"UIKeyInputLeftArrow",  {0xFF51, 0, 0, 0}},
    {"UIKeyInputRightArrow", {0xFF53, 0, 0, 0}},
    {"UIKeyInputUpArrow",    {0xFF52, 0, 0, 0}},
    {"Up",                   {0xFF52, 0, 0, 0}},
    {"Undo",                 {0xFF65, 0, 0, 0}},
    {"Win",                  {0xFFE7, 0xFFE7, 0xFFE8, 0}},
    {"Zenkaku",              {0xFF28, 0, 0, 0}},
    {"ZenkakuHankaku",       {0xFF2A, 0, 0, 0}},
  };
  return table;
}

Keysym pick(const LocatedKeysyms& syms, KeyLocation location) {
  Keysym located = syms[static_cast<std::size_t>(location)];
  return located != kNoKeysym ? located : syms[0];
}

// Simple case mapping for ASCII, Latin-1, Greek and basic Cyrillic.
std::uint32_t toUpper(std::uint32_t cp) {
  if (cp >= 'a' && cp <= 'z') return cp - 0x20;
  if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
  if (cp >= 0x3B1 && cp <= 0x3C9 && cp != 0x3C2) return cp - 0x20;
  if (cp >= 0x430 && cp <= 0x44F) return cp - 0x20;
  if (cp >= 0x450 && cp <= 0x45F) return cp - 0x50;
  return cp;
}

std::uint32_t toLower(std::uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
  if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
  if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
  if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
  return cp;
}

// Parses hex digits following "U+". Returns false if none are present.
bool parseUnicodeEscape(const std::string& identifier, std::uint32_t& out) {
  auto pos = identifier.find("U+");
  if (pos == std::string::npos) return false;

  std::uint32_t v = 0;
  int digits = 0;
  for (std::size_t i = pos + 2; i < identifier.size() && digits < 8; i++) {
    char c = identifier[i];
    std::uint32_t d;
    if (c >= '0' && c <= '9') d = static_cast<std::uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f') d = static_cast<std::uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F') d = static_cast<std::uint32_t>(c - 'A' + 10);
    else break;
    v = v * 16 + d;
    digits++;
  }
  if (digits == 0) return false;
  out = v;
  return true;
}

Keysym keysymFromTypedCodepoint(std::uint32_t cp, ShiftHint shift) {
  if (shift == ShiftHint::Shifted) cp = toUpper(cp);
  else if (shift == ShiftHint::Unshifted) cp = toLower(cp);
  return keysymFromCodepoint(cp);
}

} // namespace

Keysym keysymFromKeyCode(int keyCode, KeyLocation location) {
  const auto& table = keycodeTable();
  auto it = table.find(keyCode);
  if (it == table.end()) return kNoKeysym;
  return pick(it->second, location);
}

Keysym keysymFromKeyIdentifier(const std::string& identifier,
                               KeyLocation location,
                               ShiftHint shift) {
  if (identifier.empty()) return kNoKeysym;

  std::uint32_t cp = 0;
  if (identifier.find("U+") != std::string::npos) {
    if (!parseUnicodeEscape(identifier, cp)) return kNoKeysym;
    return keysymFromTypedCodepoint(cp, shift);
  }

  if (location != KeyLocation::Numpad) {
    auto cps = decodeUtf8(identifier);
    if (cps.size() == 1) {
      return keysymFromTypedCodepoint(cps[0], shift);
    }
  }

  const auto& table = namedKeyTable();
  auto it = table.find(identifier);
  if (it == table.end()) return kNoKeysym;
  return pick(it->second, location);
}

bool isControlCodepoint(std::uint32_t codepoint) {
  return codepoint <= 0x1F || (codepoint >= 0x7F && codepoint <= 0x9F);
}

Keysym keysymFromCodepoint(std::uint32_t codepoint) {
  if (isControlCodepoint(codepoint)) return 0xFF00 | codepoint;
  if (codepoint <= 0x00FF) return codepoint;
  if (codepoint <= 0x10FFFF) return 0x01000000 | codepoint;
  return kNoKeysym;
}

Keysym resolveKeydownKeysym(int keyCode,
                            const std::string& key,
                            const std::string& keyIdentifier,
                            KeyLocation location,
                            ShiftHint shift) {
  Keysym keysym = keysymFromKeyIdentifier(key, location);
  if (keysym != kNoKeysym) return keysym;

  keysym = keysymFromKeyCode(keyCode, location);
  if (keysym != kNoKeysym) return keysym;

  if (keyIdentifierSane(keyCode, keyIdentifier)) {
    keysym = keysymFromKeyIdentifier(keyIdentifier, location, shift);
    if (keysym != kNoKeysym) return keysym;
  }

  // Letter and digit keycodes equal their unshifted ASCII codes.
  if (keyCode >= 'A' && keyCode <= 'Z') {
    return keysymFromTypedCodepoint(static_cast<std::uint32_t>(keyCode), shift);
  }
  if (keyCode >= '0' && keyCode <= '9' && location != KeyLocation::Numpad) {
    return static_cast<Keysym>(keyCode);
  }
  return kNoKeysym;
}

bool isPrintableKeysym(Keysym keysym) {
  return keysym <= 0xFF || (keysym & 0xFFFF0000u) == 0x01000000u;
}

bool isNoRepeatKeysym(Keysym keysym) {
  switch (keysym) {
    case keysyms::AltGr:
    case keysyms::ShiftL:
    case keysyms::ShiftR:
    case keysyms::CtrlL:
    case keysyms::CtrlR:
    case keysyms::CapsLock:
    case keysyms::MetaL:
    case keysyms::MetaR:
    case keysyms::AltL:
    case keysyms::AltR:
    case keysyms::SuperL:
    case keysyms::SuperR:
      return true;
    default:
      return false;
  }
}

bool isMetaKeysym(Keysym keysym) {
  return keysym == keysyms::MetaL || keysym == keysyms::MetaR;
}

bool isLetterKeysym(Keysym keysym) {
  return (keysym >= 0x41 && keysym <= 0x5A) || (keysym >= 0x61 && keysym <= 0x7A);
}

bool keyIdentifierSane(int keyCode, const std::string& keyIdentifier) {
  if (keyIdentifier.empty()) return false;

  std::uint32_t cp = 0;
  if (keyIdentifier.find("U+") == std::string::npos) return true;
  if (!parseUnicodeEscape(keyIdentifier, cp)) return true;
  if (static_cast<std::uint32_t>(keyCode) != cp) return true;

  // keyCode equal to the codepoint is only right for A-Z and 0-9.
  if ((keyCode >= 65 && keyCode <= 90) || (keyCode >= 48 && keyCode <= 57)) return true;
  return false;
}

} // namespace ri
