#include "lc/viewport/KeyMap.hpp"

#include <algorithm>
#include <cctype>

namespace lc {

std::optional<ViewerCommand> KeyMap::lookup(const KeyEvent& ev) const {
  const Modifiers& m = ev.mods;

  if (ev.named != NamedKey::None) {
    if (m.alt || m.super) return std::nullopt;
    if (m.ctrl) {
      switch (ev.named) {
        case NamedKey::Left:  return ViewerCommand::PanLeft;
        case NamedKey::Right: return ViewerCommand::PanRight;
        case NamedKey::Up:    return ViewerCommand::PanUp;
        case NamedKey::Down:  return ViewerCommand::PanDown;
        default: return std::nullopt;
      }
    }
    switch (ev.named) {
      case NamedKey::Left:  return ViewerCommand::PreviousDocument;
      case NamedKey::Right: return ViewerCommand::NextDocument;
      default: return std::nullopt;
    }
  }

  if (m.ctrl || m.alt || m.super) return std::nullopt;

  const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(ev.ch)));
  switch (c) {
    case 'h': return ViewerCommand::FlipHorizontal;
    case 'v': return ViewerCommand::FlipVertical;
    case 'r': return m.shift ? ViewerCommand::RotateCCW : ViewerCommand::RotateCW;
    case '+':
    case '=': return ViewerCommand::ZoomIn;
    case '-': return ViewerCommand::ZoomOut;
    case '1': return ViewerCommand::ZoomReset;
    case 'f': return ViewerCommand::ToggleFit;
    case '0': return ViewerCommand::PanReset;
    case 'c': return ViewerCommand::ToggleCropMode;
    case 's': return ViewerCommand::ToggleScaleMode;
    case 'i': return ViewerCommand::ToggleContextDrawer;
    case 'n': return ViewerCommand::ToggleNavBar;
    default: return std::nullopt;
  }
}

bool parseKeyChord(const std::string& text, KeyEvent& out) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });

  KeyEvent ev;
  std::size_t pos = 0;
  std::string key;
  while (true) {
    // A trailing "+" is the plus key itself ("ctrl++" or "+").
    std::size_t plus = s.find('+', pos);
    if (plus == std::string::npos || plus == s.size() - 1 || plus == pos) {
      key = s.substr(pos);
      break;
    }
    std::string mod = s.substr(pos, plus - pos);
    if (mod == "ctrl" || mod == "control") ev.mods.ctrl = true;
    else if (mod == "shift") ev.mods.shift = true;
    else if (mod == "alt") ev.mods.alt = true;
    else if (mod == "super" || mod == "cmd" || mod == "meta") ev.mods.super = true;
    else return false;
    pos = plus + 1;
  }

  if (key == "left") ev.named = NamedKey::Left;
  else if (key == "right") ev.named = NamedKey::Right;
  else if (key == "up") ev.named = NamedKey::Up;
  else if (key == "down") ev.named = NamedKey::Down;
  else if (key.size() == 1) ev.ch = key[0];
  else return false;

  out = ev;
  return true;
}

} // namespace lc
