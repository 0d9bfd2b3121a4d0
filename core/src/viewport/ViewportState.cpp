#include "lc/viewport/ViewportState.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lc {

void ViewportState::setConfig(const ViewportConfig& cfg) {
  config_ = cfg;
  if (config_.minZoom <= 0.0) config_.minZoom = 0.10;
  if (config_.maxZoom < config_.minZoom) config_.maxZoom = config_.minZoom;
  if (config_.zoomStep <= 1.0) config_.zoomStep = 1.1;

  zoom_ = clampZoom(zoom_);
  if (mode_ == ViewMode::Fit) refit();
  clampPan();
}

bool ViewportState::setViewportSize(Size size) {
  if (size.isEmpty()) {
    viewport_ = Size{};
    return false;
  }
  viewport_ = size;
  if (mode_ == ViewMode::Fit) refit();
  clampPan();
  return true;
}

void ViewportState::setContentSize(Size effective) {
  if (effective.isEmpty()) {
    clearContent();
    return;
  }
  content_ = effective;
  if (mode_ == ViewMode::Fit) refit();
  clampPan();
}

void ViewportState::clearContent() {
  content_ = Size{};
  pan_ = Vec2{};
}

// ---- Zoom ----

void ViewportState::setZoom(double factor) {
  if (!(factor > 0.0)) return;
  mode_ = ViewMode::Custom;
  zoom_ = clampZoom(factor);
  clampPan();
}

void ViewportState::resetZoom() {
  mode_ = ViewMode::Actual;
  zoom_ = clampZoom(1.0);
  pan_ = Vec2{};
  clampPan();
}

void ViewportState::zoomIn() {
  zoomAt(zoom_ * config_.zoomStep, viewportCenter());
}

void ViewportState::zoomOut() {
  zoomAt(zoom_ / config_.zoomStep, viewportCenter());
}

void ViewportState::zoomInAt(Vec2 anchor) {
  zoomAt(zoom_ * config_.zoomStep, anchor);
}

void ViewportState::zoomOutAt(Vec2 anchor) {
  zoomAt(zoom_ / config_.zoomStep, anchor);
}

void ViewportState::zoomAt(double factor, Vec2 anchor) {
  if (!isLaidOut() || !(factor > 0.0)) return;

  const double z0 = zoom_;
  const double z1 = clampZoom(factor);
  mode_ = ViewMode::Custom;
  if (z1 == z0) return;

  // Keep screenToDocument(anchor) fixed:
  //   center + pan0 + d / z0 == center + pan1 + d / z1
  Vec2 d = anchor - viewportCenter();
  pan_ = pan_ + d * (1.0 / z0 - 1.0 / z1);
  zoom_ = z1;
  clampPan();
}

void ViewportState::setFit() {
  mode_ = ViewMode::Fit;
  pan_ = Vec2{};
  refit();
  clampPan();
}

void ViewportState::toggleFit() {
  if (mode_ != ViewMode::Fit) {
    savedMode_ = mode_;
    savedZoom_ = zoom_;
    setFit();
    return;
  }
  mode_ = savedMode_;
  zoom_ = clampZoom(savedMode_ == ViewMode::Actual ? 1.0 : savedZoom_);
  pan_ = Vec2{};
  clampPan();
}

// ---- Pan ----

void ViewportState::pan(Vec2 delta) {
  if (!isLaidOut()) return;
  pan_ = pan_ + delta;
  clampPan();
}

void ViewportState::resetPan() {
  pan_ = Vec2{};
  clampPan();
}

// ---- Queries ----

double ViewportState::fitZoom() const {
  if (!isLaidOut()) return zoom_;
  return clampZoom(std::min(viewport_.width / content_.width,
                            viewport_.height / content_.height));
}

Size ViewportState::scaledContentSize() const {
  return Size{content_.width * zoom_, content_.height * zoom_};
}

Vec2 ViewportState::maxPanOffset() const {
  if (!isLaidOut()) return Vec2{};
  Size scaled = scaledContentSize();
  double mx = std::max(0.0, (scaled.width - viewport_.width) / (2.0 * zoom_));
  double my = std::max(0.0, (scaled.height - viewport_.height) / (2.0 * zoom_));
  return Vec2{mx, my};
}

Vec2 ViewportState::screenToDocument(Vec2 screen) const {
  return contentCenter() + pan_ + (screen - viewportCenter()) / zoom_;
}

Vec2 ViewportState::documentToScreen(Vec2 doc) const {
  return viewportCenter() + (doc - contentCenter() - pan_) * zoom_;
}

Rect ViewportState::visibleDocumentRect() const {
  if (!isLaidOut()) return Rect{};
  Vec2 tl = screenToDocument(Vec2{0.0, 0.0});
  Vec2 br = screenToDocument(Vec2{viewport_.width, viewport_.height});
  double left = std::max(0.0, tl.x);
  double top = std::max(0.0, tl.y);
  double right = std::min(content_.width, br.x);
  double bottom = std::min(content_.height, br.y);
  return Rect{left, top, std::max(0.0, right - left), std::max(0.0, bottom - top)};
}

DisplayTransform ViewportState::computeDisplayTransform() const {
  Vec2 origin = documentToScreen(Vec2{0.0, 0.0});
  return DisplayTransform{zoom_, origin.x, origin.y};
}

std::string ViewportState::zoomLabel() const {
  if (mode_ == ViewMode::Fit) return "Fit";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.0f%%", zoom_ * 100.0);
  return buf;
}

// ---- Internals ----

double ViewportState::clampZoom(double z) const {
  return std::clamp(z, config_.minZoom, config_.maxZoom);
}

void ViewportState::refit() {
  if (!isLaidOut()) return;
  zoom_ = fitZoom();
}

void ViewportState::clampPan() {
  if (!isLaidOut()) return;
  Vec2 m = maxPanOffset();
  pan_.x = std::clamp(pan_.x, -m.x, m.x);
  pan_.y = std::clamp(pan_.y, -m.y, m.y);
}

} // namespace lc
