#pragma once
#include <cmath>
#include <cstdint>

namespace pxtank {

// Screen space: +x right, +y down.
struct Vec2 {
  float x{};
  float y{};

  Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
  friend Vec2 operator+(Vec2 a, const Vec2& b) { return a += b; }
  friend Vec2 operator-(const Vec2& a, const Vec2& b) { return {a.x - b.x, a.y - b.y}; }
  friend Vec2 operator*(const Vec2& a, float s) { return {a.x * s, a.y * s}; }
  friend bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }

  float length_squared() const { return x*x + y*y; }
  float length() const { return std::sqrt(length_squared()); }
  bool is_zero() const { return x == 0.0f && y == 0.0f; }

  // Zero stays zero.
  Vec2 normalized() const {
    const float len = length();
    if (len <= 0.0f) return {};
    return {x / len, y / len};
  }
};

struct Point {
  int x{};
  int y{};
  friend bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
  friend bool operator!=(const Point& a, const Point& b) { return !(a == b); }
};

inline int round_to_int(float v) { return static_cast<int>(std::lround(v)); }
inline Point round_point(const Vec2& v) { return {round_to_int(v.x), round_to_int(v.y)}; }
inline Vec2 to_vec(const Point& p) { return {static_cast<float>(p.x), static_cast<float>(p.y)}; }

// Integer axis-aligned box (left, top, width, height).
// center() uses integer halves so set_center(c); center() == c always holds.
struct Rect {
  int x{};
  int y{};
  int w{};
  int h{};

  int left() const { return x; }
  int top() const { return y; }
  int right() const { return x + w; }
  int bottom() const { return y + h; }

  Point center() const { return {x + w / 2, y + h / 2}; }
  void set_center(Point c) { x = c.x - w / 2; y = c.y - h / 2; }
  void set_center_x(int cx) { x = cx - w / 2; }
  void set_center_y(int cy) { y = cy - h / 2; }

  void set_left(int v) { x = v; }
  void set_right(int v) { x = v - w; }
  void set_top(int v) { y = v; }
  void set_bottom(int v) { y = v - h; }

  bool empty() const { return w <= 0 || h <= 0; }

  static Rect centered_at(Point c, int w, int h) {
    Rect r{0, 0, w, h};
    r.set_center(c);
    return r;
  }

  friend bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
  }
};

// Strict overlap: shared edges do not count, empty rects never overlap.
inline bool overlaps(const Rect& a, const Rect& b) {
  if (a.empty() || b.empty()) return false;
  return a.x < b.right() && b.x < a.right() && a.y < b.bottom() && b.y < a.bottom();
}

// True when inner lies entirely within outer (edges inclusive).
inline bool contains(const Rect& outer, const Rect& inner) {
  return inner.x >= outer.x && inner.y >= outer.y &&
         inner.right() <= outer.right() && inner.bottom() <= outer.bottom();
}

// Moves r inside bounds; an axis where r is larger than bounds is centered.
inline Rect clamped_into(Rect r, const Rect& bounds) {
  if (r.w >= bounds.w) {
    r.x = bounds.x + bounds.w / 2 - r.w / 2;
  } else if (r.x < bounds.x) {
    r.x = bounds.x;
  } else if (r.right() > bounds.right()) {
    r.x = bounds.right() - r.w;
  }
  if (r.h >= bounds.h) {
    r.y = bounds.y + bounds.h / 2 - r.h / 2;
  } else if (r.y < bounds.y) {
    r.y = bounds.y;
  } else if (r.bottom() > bounds.bottom()) {
    r.y = bounds.bottom() - r.h;
  }
  return r;
}

inline float distance(Point a, Point b) {
  const float dx = static_cast<float>(a.x - b.x);
  const float dy = static_cast<float>(a.y - b.y);
  return std::sqrt(dx*dx + dy*dy);
}

enum class Facing : std::uint8_t { Up, Down, Left, Right };

// Closest cardinal facing; ties go vertical, zero is Up.
inline Facing facing_of(const Vec2& d) {
  if (d.is_zero()) return Facing::Up;
  if (std::fabs(d.x) > std::fabs(d.y)) return d.x > 0.0f ? Facing::Right : Facing::Left;
  return d.y > 0.0f ? Facing::Down : Facing::Up;
}

inline Vec2 facing_vector(Facing f) {
  switch (f) {
    case Facing::Up:    return {0.0f, -1.0f};
    case Facing::Down:  return {0.0f,  1.0f};
    case Facing::Left:  return {-1.0f, 0.0f};
    case Facing::Right: return {1.0f,  0.0f};
  }
  return {0.0f, -1.0f};
}

inline bool is_horizontal(Facing f) { return f == Facing::Left || f == Facing::Right; }

} // namespace pxtank
