#pragma once
#include "lc/geom/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lc {

// Discrete commands. Pointer gestures use PointerEvent instead.
enum class ViewerCommand : std::uint8_t {
  PreviousDocument = 0,
  NextDocument,
  FlipHorizontal,
  FlipVertical,
  RotateCW,
  RotateCCW,
  ZoomIn,
  ZoomOut,
  ZoomReset,
  ToggleFit,
  PanLeft,
  PanRight,
  PanUp,
  PanDown,
  PanReset,
  ToggleCropMode,   // reserved, no editing behaviour
  ToggleScaleMode,  // reserved, no editing behaviour
  ToggleNavBar,
  ToggleContextDrawer
};

// Wire names, e.g. "zoomIn", "rotateCW".
const char* toString(ViewerCommand c);
std::optional<ViewerCommand> commandFromString(const std::string& name);

// Viewport-only commands handled by InputReconciler.
bool isViewportCommand(ViewerCommand c);

enum class PointerKind : std::uint8_t { Wheel = 0, DragStart, DragMove, DragEnd };

// Generic pointer event, toolkit-agnostic. Position in viewport pixels,
// 0 = left/top. `amount` is the wheel delta (positive = zoom in).
struct PointerEvent {
  PointerKind kind{PointerKind::Wheel};
  double x{0}, y{0};
  double amount{0};

  Vec2 position() const { return Vec2{x, y}; }
};

struct Modifiers {
  bool ctrl{false};
  bool shift{false};
  bool alt{false};
  bool super{false};

  bool any() const { return ctrl || shift || alt || super; }
};

enum class NamedKey : std::uint8_t { None = 0, Left, Right, Up, Down };

// A key press: either a named key or a single printable character.
struct KeyEvent {
  NamedKey named{NamedKey::None};
  char ch{0};
  Modifiers mods;
};

struct InputReconcilerConfig {
  double panStep{50.0};  // document pixels per keyboard pan
};

} // namespace lc
