#pragma once

#include <algorithm>
#include <cmath>

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
  bool operator==(const Vec2&) const = default;
};

struct Rect {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;

  [[nodiscard]] float left() const { return x; }
  [[nodiscard]] float right() const { return x + w; }
  [[nodiscard]] float top() const { return y; }
  [[nodiscard]] float bottom() const { return y + h; }
  [[nodiscard]] float centerX() const { return x + w * 0.5F; }

  bool operator==(const Rect&) const = default;
};

namespace util {

inline float clampf(float v, float lo, float hi) {
  return std::min(std::max(v, lo), hi);
}

inline bool aabbOverlap(const Rect& a, const Rect& b) {
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h && a.y + a.h > b.y;
}

// Smallest rect containing both; used as the swept box for a frame's motion.
inline Rect unionRect(const Rect& a, const Rect& b) {
  const float x0 = std::min(a.x, b.x);
  const float y0 = std::min(a.y, b.y);
  const float x1 = std::max(a.right(), b.right());
  const float y1 = std::max(a.bottom(), b.bottom());
  return Rect{x0, y0, x1 - x0, y1 - y0};
}

// -1 when `a` sits left of `b`'s centre, +1 otherwise.
inline int awayFrom(const Rect& a, const Rect& b) {
  return (a.centerX() < b.centerX()) ? -1 : 1;
}

}  // namespace util
