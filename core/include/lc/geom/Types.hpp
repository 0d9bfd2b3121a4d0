#pragma once
#include <cmath>
#include <cstdint>

namespace lc {

struct Vec2 {
  double x{0}, y{0};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double s) { return {a.x * s, a.y * s}; }
inline Vec2 operator/(Vec2 a, double s) { return {a.x / s, a.y / s}; }

struct Size {
  double width{0}, height{0};

  // NaN and infinite extents count as empty.
  bool isEmpty() const {
    return !(width > 0.0) || !(height > 0.0) || !std::isfinite(width) ||
           !std::isfinite(height);
  }
};

inline bool operator==(Size a, Size b) {
  return a.width == b.width && a.height == b.height;
}
inline bool operator!=(Size a, Size b) { return !(a == b); }

// Axis-aligned rectangle, top-left origin.
struct Rect {
  double x{0}, y{0}, width{0}, height{0};
};

// Integer pixel coordinate.
struct PixelPos {
  std::uint32_t x{0}, y{0};
};

} // namespace lc
