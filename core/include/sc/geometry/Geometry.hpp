#pragma once

namespace sc {

// Surface-local coordinates: origin top-left, +y down.
struct Point {
  double x{0}, y{0};
  bool operator==(const Point& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
  double width{0}, height{0};
  bool operator==(const Size& o) const { return width == o.width && height == o.height; }
  bool operator!=(const Size& o) const { return !(*this == o); }
};

// Edge form: [left, right] x [top, bottom].
struct Rect {
  double left{0}, top{0}, right{0}, bottom{0};

  double width() const { return right - left; }
  double height() const { return bottom - top; }
};

using Bounds = Rect;

Rect rectAt(const Point& topLeft, const Size& size);

// Half-open test: rectangles that only share an edge do not overlap.
bool rectOverlap(const Rect& a, const Rect& b);

double distance(const Point& p1, const Point& p2);

// Inclusive on all four edges.
bool pointInRect(const Point& p, const Rect& rect);

// True when `inner` lies entirely inside `outer` (edges may touch).
bool rectContains(const Rect& outer, const Rect& inner);

} // namespace sc
