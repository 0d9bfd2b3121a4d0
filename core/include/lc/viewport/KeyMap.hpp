#pragma once
#include "lc/viewport/InputState.hpp"

#include <optional>
#include <string>

namespace lc {

// Maps a key press to a ViewerCommand.
//
//   Ctrl+arrows      pan
//   Left / Right     previous / next document
//   h / v            flip horizontal / vertical
//   r / Shift+r      rotate clockwise / counter-clockwise
//   + or = / -       zoom in / out
//   1                actual size
//   f                toggle fit
//   0                centre (pan reset)
//   c / s            crop / scale tool toggles
//   i / n            context drawer / nav bar
//
// Other Ctrl, Alt or Super combinations map to nothing.
class KeyMap {
public:
  std::optional<ViewerCommand> lookup(const KeyEvent& ev) const;
};

// Parses "ctrl+left", "shift+r", "+", "f" into a KeyEvent.
// Returns false for an empty or unknown key name.
bool parseKeyChord(const std::string& text, KeyEvent& out);

} // namespace lc
