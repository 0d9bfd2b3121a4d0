#pragma once
#include "lc/geom/Types.hpp"
#include <cstdint>

namespace lc {

enum class Rotation : std::uint8_t { R0 = 0, R90, R180, R270 };

inline int toDegrees(Rotation r) {
  switch (r) {
    case Rotation::R0: return 0;
    case Rotation::R90: return 90;
    case Rotation::R180: return 180;
    case Rotation::R270: return 270;
    default: return 0;
  }
}

// Lossless geometric state of the active document.
// Composition order is fixed: flips act on the document's original local
// axes, then the flipped image is rotated clockwise by `rotation`.
struct TransformState {
  Rotation rotation{Rotation::R0};
  bool flipHorizontal{false};
  bool flipVertical{false};

  bool isIdentity() const {
    return rotation == Rotation::R0 && !flipHorizontal && !flipVertical;
  }
  bool swapsAxes() const {
    return rotation == Rotation::R90 || rotation == Rotation::R270;
  }
};

inline bool operator==(const TransformState& a, const TransformState& b) {
  return a.rotation == b.rotation && a.flipHorizontal == b.flipHorizontal &&
         a.flipVertical == b.flipVertical;
}
inline bool operator!=(const TransformState& a, const TransformState& b) {
  return !(a == b);
}

class TransformModel {
public:
  void applyRotateClockwise();
  void applyRotateCounterClockwise();
  void applyFlipHorizontal();
  void applyFlipVertical();
  void reset();

  const TransformState& state() const { return state_; }
  int rotationDegrees() const { return toDegrees(state_.rotation); }

  // Displayed size after rotation (flips never change size).
  Size effectiveSize(Size intrinsic) const;
  static Size effectiveSize(const TransformState& t, Size intrinsic);

  // Destination of source pixel (x, y) of a w x h image under `t`.
  static PixelPos mapPixel(const TransformState& t, std::uint32_t x,
                           std::uint32_t y, std::uint32_t w, std::uint32_t h);

private:
  TransformState state_;
};

} // namespace lc
