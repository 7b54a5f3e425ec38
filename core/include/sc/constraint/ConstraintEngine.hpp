#pragma once
#include "sc/geometry/Geometry.hpp"
#include "sc/ids/Id.hpp"
#include "sc/surface/SurfaceConfig.hpp"

#include <vector>

namespace sc {

class ComponentRegistry;
struct PlacedComponent;

// Rounds both axes to the nearest multiple of gridSize (halves round up).
// Identity when gridSize <= 0.
Point snapToGrid(const Point& pos, double gridSize);

// x into [left, right - width], y into [top, bottom - height].
// An axis whose size exceeds the bounds pins to left/top.
Point clampToBoundary(const Point& pos, const Size& size, const Bounds& bounds);

class ConstraintEngine {
public:
  // cfg is expected to have passed validateConfig().
  void setConfig(const SurfaceConfig& cfg) { config_ = cfg; }
  void setBounds(const Bounds& bounds) { bounds_ = bounds; }

  const SurfaceConfig& config() const { return config_; }
  const Bounds& bounds() const { return bounds_; }

  // Honors config().snapToGrid.
  Point snap(const Point& pos) const;
  Point clamp(const Point& pos, const Size& size) const;

  // Visible components other than selfId whose rectangles overlap rect.
  std::vector<ComponentId> findCollisions(const ComponentRegistry& reg,
                                          const ComponentId& selfId,
                                          const Rect& rect) const;
  bool collides(const ComponentRegistry& reg, const ComponentId& selfId,
                const Rect& rect) const;

  // Bounded local search: candidate, then the 8-probe ring (each re-clamped),
  // else the component's current position. Passthrough when detection is off.
  Point resolveCollisions(const ComponentRegistry& reg, const PlacedComponent& component,
                          const Point& candidate) const;

  // snap -> clamp -> resolve.
  Point constrain(const ComponentRegistry& reg, const PlacedComponent& component,
                  const Point& rawCandidate) const;

private:
  SurfaceConfig config_;
  Bounds bounds_{};
};

} // namespace sc
