#include "sc/constraint/ConstraintEngine.hpp"
#include "sc/registry/ComponentRegistry.hpp"

#include <algorithm>
#include <cmath>

namespace sc {

namespace {

double snapAxis(double v, double g) {
  // floor(v/g + 0.5): ties go toward +inf on both sides of zero.
  return std::floor(v / g + 0.5) * g;
}

double clampAxis(double v, double lo, double hi, double extent) {
  v = std::min(v, hi - extent);
  return std::max(v, lo);
}

} // namespace

Point snapToGrid(const Point& pos, double gridSize) {
  if (!(gridSize > 0.0)) return pos;
  return {snapAxis(pos.x, gridSize), snapAxis(pos.y, gridSize)};
}

Point clampToBoundary(const Point& pos, const Size& size, const Bounds& bounds) {
  return {clampAxis(pos.x, bounds.left, bounds.right, size.width),
          clampAxis(pos.y, bounds.top, bounds.bottom, size.height)};
}

Point ConstraintEngine::snap(const Point& pos) const {
  if (!config_.snapToGrid) return pos;
  return snapToGrid(pos, config_.gridSize);
}

Point ConstraintEngine::clamp(const Point& pos, const Size& size) const {
  return clampToBoundary(pos, size, bounds_);
}

std::vector<ComponentId> ConstraintEngine::findCollisions(const ComponentRegistry& reg,
                                                          const ComponentId& selfId,
                                                          const Rect& rect) const {
  std::vector<ComponentId> out;
  for (const auto& other : reg.components()) {
    if (other.id == selfId || !other.visible) continue;
    if (rectOverlap(rect, other.rect())) out.push_back(other.id);
  }
  return out;
}

bool ConstraintEngine::collides(const ComponentRegistry& reg, const ComponentId& selfId,
                                const Rect& rect) const {
  for (const auto& other : reg.components()) {
    if (other.id == selfId || !other.visible) continue;
    if (rectOverlap(rect, other.rect())) return true;
  }
  return false;
}

Point ConstraintEngine::resolveCollisions(const ComponentRegistry& reg,
                                          const PlacedComponent& component,
                                          const Point& candidate) const {
  if (!config_.collisionDetection) return candidate;

  if (!collides(reg, component.id, rectAt(candidate, component.size))) return candidate;

  const double d = config_.probeOffset;
  const Point ring[8] = {
    {candidate.x + d, candidate.y},
    {candidate.x - d, candidate.y},
    {candidate.x, candidate.y + d},
    {candidate.x, candidate.y - d},
    {candidate.x + d, candidate.y + d},
    {candidate.x - d, candidate.y - d},
    {candidate.x + d, candidate.y - d},
    {candidate.x - d, candidate.y + d},
  };

  for (const auto& probe : ring) {
    Point p = clamp(probe, component.size);
    if (!collides(reg, component.id, rectAt(p, component.size))) return p;
  }

  // Stick: keep the last accepted position.
  return component.position;
}

Point ConstraintEngine::constrain(const ComponentRegistry& reg,
                                  const PlacedComponent& component,
                                  const Point& rawCandidate) const {
  Point p = snap(rawCandidate);
  p = clamp(p, component.size);
  return resolveCollisions(reg, component, p);
}

} // namespace sc
