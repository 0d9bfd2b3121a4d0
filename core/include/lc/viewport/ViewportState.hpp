#pragma once
#include "lc/geom/Types.hpp"

#include <cstdint>
#include <string>

namespace lc {

enum class ViewMode : std::uint8_t { Fit = 0, Actual, Custom };

inline const char* toString(ViewMode m) {
  switch (m) {
    case ViewMode::Fit: return "fit";
    case ViewMode::Actual: return "actual";
    case ViewMode::Custom: return "custom";
    default: return "unknown";
  }
}

struct ViewportConfig {
  double minZoom{0.10};
  double maxZoom{20.0};
  double zoomStep{1.1};  // zoomIn multiplies, zoomOut divides
};

// Screen placement of the transformed document for the renderer:
// screen = document * scale + (tx, ty).
struct DisplayTransform {
  double scale{1.0};
  double tx{0}, ty{0};
};

// Zoom, pan and view mode of the active document.
//
// Pan is expressed in document pixels of the transformed (rotated) frame,
// as the offset of the viewport centre from the document centre. (0, 0)
// is the centred position. After every mutation the pan satisfies the clamp
// policy: on an axis where the zoomed document fits inside the viewport the
// pan is 0, otherwise no document edge may move inward past the viewport edge.
//
// Until both the viewport and the content have a non-zero size the state is
// "not laid out" and zoom/pan computations are deferred.
class ViewportState {
public:
  void setConfig(const ViewportConfig& cfg);
  const ViewportConfig& config() const { return config_; }

  // Non-positive sizes are rejected (returns false) and leave the viewport
  // not laid out.
  bool setViewportSize(Size size);

  // Effective (transformed) size of the active document.
  void setContentSize(Size effective);
  void clearContent();

  void setZoom(double factor);
  void resetZoom();  // Actual size, centred
  void zoomIn();
  void zoomOut();

  // Anchored zoom: the document point under `anchor` (screen pixels,
  // viewport-relative) stays under it unless the clamp policy intervenes.
  void zoomAt(double factor, Vec2 anchor);
  void zoomInAt(Vec2 anchor);
  void zoomOutAt(Vec2 anchor);

  void setFit();
  void toggleFit();

  void pan(Vec2 delta);
  void resetPan();

  ViewMode mode() const { return mode_; }
  double zoom() const { return zoom_; }
  Vec2 panOffset() const { return pan_; }
  Size viewportSize() const { return viewport_; }
  Size contentSize() const { return content_; }
  bool isLaidOut() const { return !viewport_.isEmpty() && !content_.isEmpty(); }

  double fitZoom() const;
  Size scaledContentSize() const;
  Vec2 maxPanOffset() const;

  Vec2 screenToDocument(Vec2 screen) const;
  Vec2 documentToScreen(Vec2 doc) const;
  Rect visibleDocumentRect() const;
  DisplayTransform computeDisplayTransform() const;

  // "Fit" in fit mode, otherwise the zoom as a percentage ("150%").
  std::string zoomLabel() const;

private:
  double clampZoom(double z) const;
  void refit();
  void clampPan();
  Vec2 viewportCenter() const { return Vec2{viewport_.width * 0.5, viewport_.height * 0.5}; }
  Vec2 contentCenter() const { return Vec2{content_.width * 0.5, content_.height * 0.5}; }

  ViewportConfig config_;
  ViewMode mode_{ViewMode::Fit};
  double zoom_{1.0};
  Vec2 pan_{};
  Size viewport_{};
  Size content_{};

  // Explicit mode restored when leaving Fit through toggleFit().
  ViewMode savedMode_{ViewMode::Actual};
  double savedZoom_{1.0};
};

} // namespace lc
