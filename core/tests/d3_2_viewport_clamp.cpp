// D3.2 — Viewport clamp and coordinate mapping test
// Tests: pan bounds keep document edges at viewport edges, content equal to
// viewport pins pan, screen/document mapping, visible rect, display
// transform, content shrink reclamps.

#include "lc/viewport/ViewportState.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static lc::ViewportState zoomed2x() {
  lc::ViewportState vp;
  vp.setViewportSize(lc::Size{800, 600});
  vp.setContentSize(lc::Size{1600, 1200});
  vp.setZoom(2.0);
  return vp;
}

int main() {
  // --- Test 1: max pan offset ---
  {
    lc::ViewportState vp = zoomed2x();
    lc::Vec2 m = vp.maxPanOffset();
    requireNear(m.x, 600, 1e-9, "max pan x = (3200-800)/4");
    requireNear(m.y, 450, 1e-9, "max pan y = (2400-600)/4");
    lc::Size sc = vp.scaledContentSize();
    requireNear(sc.width, 3200, 1e-9, "scaled width");
    requireNear(sc.height, 2400, 1e-9, "scaled height");
    std::printf("  Test 1 (max pan offset) PASS\n");
  }

  // --- Test 2: at the pan limit the document edge meets the viewport edge ---
  {
    lc::ViewportState vp = zoomed2x();
    vp.pan(lc::Vec2{10000, 10000});
    lc::Vec2 br = vp.documentToScreen(lc::Vec2{1600, 1200});
    requireNear(br.x, 800, 1e-9, "right edge at viewport right");
    requireNear(br.y, 600, 1e-9, "bottom edge at viewport bottom");

    vp.pan(lc::Vec2{-20000, -20000});
    lc::Vec2 tl = vp.documentToScreen(lc::Vec2{0, 0});
    requireNear(tl.x, 0, 1e-9, "left edge at viewport left");
    requireNear(tl.y, 0, 1e-9, "top edge at viewport top");
    std::printf("  Test 2 (edges never move inward) PASS\n");
  }

  // --- Test 3: content equal to viewport pins pan at 0 ---
  {
    lc::ViewportState vp;
    vp.setViewportSize(lc::Size{800, 600});
    vp.setContentSize(lc::Size{800, 600});
    vp.resetZoom();
    vp.pan(lc::Vec2{30, -30});
    requireNear(vp.panOffset().x, 0, 1e-12, "pan x pinned");
    requireNear(vp.panOffset().y, 0, 1e-12, "pan y pinned");
    std::printf("  Test 3 (equal size pins pan) PASS\n");
  }

  // --- Test 4: one axis fits, the other overflows ---
  {
    lc::ViewportState vp;
    vp.setViewportSize(lc::Size{800, 600});
    vp.setContentSize(lc::Size{2000, 400});
    vp.resetZoom();
    vp.pan(lc::Vec2{5000, 5000});
    requireNear(vp.panOffset().x, 600, 1e-9, "x overflows: (2000-800)/2");
    requireNear(vp.panOffset().y, 0, 1e-12, "y fits: centred");
    std::printf("  Test 4 (per-axis clamp) PASS\n");
  }

  // --- Test 5: screenToDocument inverts documentToScreen ---
  {
    lc::ViewportState vp = zoomed2x();
    vp.pan(lc::Vec2{123, -77});
    lc::Vec2 d{321.5, 987.25};
    lc::Vec2 s = vp.documentToScreen(d);
    lc::Vec2 back = vp.screenToDocument(s);
    requireNear(back.x, d.x, 1e-9, "round trip x");
    requireNear(back.y, d.y, 1e-9, "round trip y");

    lc::Vec2 c = vp.screenToDocument(lc::Vec2{400, 300});
    requireNear(c.x, 800 + 123, 1e-9, "viewport centre = doc centre + pan (x)");
    requireNear(c.y, 600 - 77, 1e-9, "viewport centre = doc centre + pan (y)");
    std::printf("  Test 5 (coordinate mapping) PASS\n");
  }

  // --- Test 6: visible rect ---
  {
    lc::ViewportState vp = zoomed2x();
    vp.pan(lc::Vec2{600, 450});
    lc::Rect r = vp.visibleDocumentRect();
    requireNear(r.x, 1200, 1e-9, "visible x");
    requireNear(r.y, 900, 1e-9, "visible y");
    requireNear(r.width, 400, 1e-9, "visible width");
    requireNear(r.height, 300, 1e-9, "visible height");

    vp.setFit();
    r = vp.visibleDocumentRect();
    requireNear(r.width, 1600, 1e-9, "fit shows whole width");
    requireNear(r.height, 1200, 1e-9, "fit shows whole height");
    std::printf("  Test 6 (visible rect) PASS\n");
  }

  // --- Test 7: display transform letterboxes ---
  {
    lc::ViewportState vp;
    vp.setViewportSize(lc::Size{800, 600});
    vp.setContentSize(lc::Size{1600, 600});
    lc::DisplayTransform dt = vp.computeDisplayTransform();
    requireNear(dt.scale, 0.5, 1e-12, "scale 0.5");
    requireNear(dt.tx, 0, 1e-9, "no horizontal bar");
    requireNear(dt.ty, 150, 1e-9, "vertical letterbox 150");
    std::printf("  Test 7 (display transform) PASS\n");
  }

  // --- Test 8: smaller content reclamps existing pan ---
  {
    lc::ViewportState vp = zoomed2x();
    vp.pan(lc::Vec2{600, 450});
    vp.setContentSize(lc::Size{800, 600});
    requireNear(vp.panOffset().x, 200, 1e-9, "reclamped x");
    requireNear(vp.panOffset().y, 150, 1e-9, "reclamped y");
    vp.resetPan();
    requireNear(vp.panOffset().x, 0, 1e-12, "resetPan");
    std::printf("  Test 8 (content change reclamps) PASS\n");
  }

  std::printf("D3.2 viewport_clamp: ALL PASS\n");
  return 0;
}
