#include "lc/viewport/InputState.hpp"

namespace lc {

namespace {

struct CommandName {
  ViewerCommand cmd;
  const char* name;
};

const CommandName kCommandNames[] = {
  {ViewerCommand::PreviousDocument,    "previousDocument"},
  {ViewerCommand::NextDocument,        "nextDocument"},
  {ViewerCommand::FlipHorizontal,      "flipHorizontal"},
  {ViewerCommand::FlipVertical,        "flipVertical"},
  {ViewerCommand::RotateCW,            "rotateCW"},
  {ViewerCommand::RotateCCW,           "rotateCCW"},
  {ViewerCommand::ZoomIn,              "zoomIn"},
  {ViewerCommand::ZoomOut,             "zoomOut"},
  {ViewerCommand::ZoomReset,           "zoomReset"},
  {ViewerCommand::ToggleFit,           "toggleFit"},
  {ViewerCommand::PanLeft,             "panLeft"},
  {ViewerCommand::PanRight,            "panRight"},
  {ViewerCommand::PanUp,               "panUp"},
  {ViewerCommand::PanDown,             "panDown"},
  {ViewerCommand::PanReset,            "panReset"},
  {ViewerCommand::ToggleCropMode,      "toggleCropMode"},
  {ViewerCommand::ToggleScaleMode,     "toggleScaleMode"},
  {ViewerCommand::ToggleNavBar,        "toggleNavBar"},
  {ViewerCommand::ToggleContextDrawer, "toggleContextDrawer"},
};

} // namespace

const char* toString(ViewerCommand c) {
  for (const auto& e : kCommandNames) {
    if (e.cmd == c) return e.name;
  }
  return "unknown";
}

std::optional<ViewerCommand> commandFromString(const std::string& name) {
  for (const auto& e : kCommandNames) {
    if (name == e.name) return e.cmd;
  }
  return std::nullopt;
}

bool isViewportCommand(ViewerCommand c) {
  switch (c) {
    case ViewerCommand::ZoomIn:
    case ViewerCommand::ZoomOut:
    case ViewerCommand::ZoomReset:
    case ViewerCommand::ToggleFit:
    case ViewerCommand::PanLeft:
    case ViewerCommand::PanRight:
    case ViewerCommand::PanUp:
    case ViewerCommand::PanDown:
    case ViewerCommand::PanReset:
      return true;
    default:
      return false;
  }
}

} // namespace lc
