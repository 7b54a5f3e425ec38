#include "sc/geometry/Geometry.hpp"

#include <cmath>

namespace sc {

Rect rectAt(const Point& topLeft, const Size& size) {
  return {topLeft.x, topLeft.y, topLeft.x + size.width, topLeft.y + size.height};
}

bool rectOverlap(const Rect& a, const Rect& b) {
  return a.left < b.right && b.left < a.right &&
         a.top < b.bottom && b.top < a.bottom;
}

double distance(const Point& p1, const Point& p2) {
  double dx = p1.x - p2.x;
  double dy = p1.y - p2.y;
  return std::sqrt(dx * dx + dy * dy);
}

bool pointInRect(const Point& p, const Rect& rect) {
  return p.x >= rect.left && p.x <= rect.right &&
         p.y >= rect.top && p.y <= rect.bottom;
}

bool rectContains(const Rect& outer, const Rect& inner) {
  return inner.left >= outer.left && inner.right <= outer.right &&
         inner.top >= outer.top && inner.bottom <= outer.bottom;
}

} // namespace sc
