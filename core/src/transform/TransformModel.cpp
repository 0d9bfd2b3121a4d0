#include "lc/transform/TransformModel.hpp"

namespace lc {

void TransformModel::applyRotateClockwise() {
  switch (state_.rotation) {
    case Rotation::R0: state_.rotation = Rotation::R90; break;
    case Rotation::R90: state_.rotation = Rotation::R180; break;
    case Rotation::R180: state_.rotation = Rotation::R270; break;
    case Rotation::R270: state_.rotation = Rotation::R0; break;
  }
}

void TransformModel::applyRotateCounterClockwise() {
  switch (state_.rotation) {
    case Rotation::R0: state_.rotation = Rotation::R270; break;
    case Rotation::R90: state_.rotation = Rotation::R0; break;
    case Rotation::R180: state_.rotation = Rotation::R90; break;
    case Rotation::R270: state_.rotation = Rotation::R180; break;
  }
}

// Flips toggle in local axes, so they are independent of the current rotation.
void TransformModel::applyFlipHorizontal() {
  state_.flipHorizontal = !state_.flipHorizontal;
}

void TransformModel::applyFlipVertical() {
  state_.flipVertical = !state_.flipVertical;
}

void TransformModel::reset() { state_ = TransformState{}; }

Size TransformModel::effectiveSize(Size intrinsic) const {
  return effectiveSize(state_, intrinsic);
}

Size TransformModel::effectiveSize(const TransformState& t, Size intrinsic) {
  if (t.swapsAxes()) return Size{intrinsic.height, intrinsic.width};
  return intrinsic;
}

PixelPos TransformModel::mapPixel(const TransformState& t, std::uint32_t x,
                                  std::uint32_t y, std::uint32_t w,
                                  std::uint32_t h) {
  // 1. flip in local frame (w x h)
  std::uint32_t fx = t.flipHorizontal ? (w - 1 - x) : x;
  std::uint32_t fy = t.flipVertical ? (h - 1 - y) : y;

  // 2. rotate clockwise
  switch (t.rotation) {
    case Rotation::R90:  return PixelPos{h - 1 - fy, fx};         // h x w
    case Rotation::R180: return PixelPos{w - 1 - fx, h - 1 - fy}; // w x h
    case Rotation::R270: return PixelPos{fy, w - 1 - fx};         // h x w
    case Rotation::R0:
    default:
      return PixelPos{fx, fy};
  }
}

} // namespace lc
