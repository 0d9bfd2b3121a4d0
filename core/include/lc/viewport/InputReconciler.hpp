#pragma once
#include "lc/viewport/InputState.hpp"
#include "lc/viewport/ViewportState.hpp"

namespace lc {

// Routes discrete commands and pointer gestures into one ViewportState.
// Holds no zoom/pan copy of its own; the only state kept is the drag anchor.
class InputReconciler {
public:
  void setConfig(const InputReconcilerConfig& cfg);
  const InputReconcilerConfig& config() const { return config_; }

  // Viewport commands only (see isViewportCommand). Returns true if handled.
  bool applyCommand(ViewerCommand cmd, ViewportState& vp);

  // Returns true if the event was consumed.
  bool processPointer(const PointerEvent& ev, ViewportState& vp);

  bool isDragging() const { return dragging_; }
  void cancelDrag() { dragging_ = false; }

  // Call after changing `vp` outside this reconciler (setZoom, content or
  // viewport resize). An active drag continues from the current pan.
  void reanchor(const ViewportState& vp);

private:
  static bool insideViewport(const ViewportState& vp, Vec2 p);
  void anchorDrag(Vec2 pos, const ViewportState& vp);

  InputReconcilerConfig config_;
  bool dragging_{false};
  Vec2 dragStartPos_{};
  Vec2 dragStartPan_{};
  Vec2 lastPointer_{};
};

} // namespace lc
