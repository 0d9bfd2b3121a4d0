#include "lc/viewport/InputReconciler.hpp"

namespace lc {

void InputReconciler::setConfig(const InputReconcilerConfig& cfg) {
  config_ = cfg;
  if (config_.panStep <= 0.0) config_.panStep = 50.0;
}

bool InputReconciler::applyCommand(ViewerCommand cmd, ViewportState& vp) {
  const double step = config_.panStep;
  switch (cmd) {
    case ViewerCommand::ZoomIn:    vp.zoomIn(); break;
    case ViewerCommand::ZoomOut:   vp.zoomOut(); break;
    case ViewerCommand::ZoomReset: vp.resetZoom(); break;
    case ViewerCommand::ToggleFit: vp.toggleFit(); break;
    // Pan moves the view: PanLeft reveals content to the left.
    case ViewerCommand::PanLeft:   vp.pan(Vec2{-step, 0.0}); break;
    case ViewerCommand::PanRight:  vp.pan(Vec2{step, 0.0}); break;
    case ViewerCommand::PanUp:     vp.pan(Vec2{0.0, -step}); break;
    case ViewerCommand::PanDown:   vp.pan(Vec2{0.0, step}); break;
    case ViewerCommand::PanReset:  vp.resetPan(); break;
    default:
      return false;
  }

  // A keyboard change while dragging must not be undone by the next move.
  reanchor(vp);
  return true;
}

bool InputReconciler::processPointer(const PointerEvent& ev, ViewportState& vp) {
  const Vec2 pos = ev.position();

  switch (ev.kind) {
    case PointerKind::Wheel: {
      if (ev.amount == 0.0 || !insideViewport(vp, pos)) return false;
      if (ev.amount > 0.0) {
        vp.zoomInAt(pos);
      } else {
        vp.zoomOutAt(pos);
      }
      reanchor(vp);
      return true;
    }

    case PointerKind::DragStart:
      dragging_ = true;
      anchorDrag(pos, vp);
      lastPointer_ = pos;
      return true;

    case PointerKind::DragMove: {
      if (!dragging_) return false;
      lastPointer_ = pos;
      const double z = vp.zoom();
      if (z <= 0.0) return false;
      // Content follows the pointer: dragging right moves the view left.
      Vec2 target = dragStartPan_ - (pos - dragStartPos_) / z;
      vp.pan(target - vp.panOffset());
      return true;
    }

    case PointerKind::DragEnd:
      if (!dragging_) return false;
      dragging_ = false;
      return true;
  }
  return false;
}

bool InputReconciler::insideViewport(const ViewportState& vp, Vec2 p) {
  Size s = vp.viewportSize();
  return p.x >= 0.0 && p.y >= 0.0 && p.x <= s.width && p.y <= s.height;
}

void InputReconciler::reanchor(const ViewportState& vp) {
  if (dragging_) anchorDrag(lastPointer_, vp);
}

void InputReconciler::anchorDrag(Vec2 pos, const ViewportState& vp) {
  dragStartPos_ = pos;
  dragStartPan_ = vp.panOffset();
}

} // namespace lc
