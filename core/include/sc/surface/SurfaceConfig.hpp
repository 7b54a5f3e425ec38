#pragma once
#include "sc/core/OpResult.hpp"
#include "sc/geometry/Geometry.hpp"

namespace sc {

struct SurfaceConfig {
  double gridSize{10.0};
  bool snapToGrid{true};
  bool collisionDetection{true};

  // When false, boundaries track the full surface [0, 0, width, height].
  bool hasBoundaries{false};
  Bounds boundaries{};

  // Distance of the collision probe ring, in surface units (not scaled by zoom).
  double probeOffset{10.0};
};

// Host client coordinates -> surface-local: (client - origin) / zoom.
struct SurfaceMapping {
  double originX{0}, originY{0};
  double zoom{1.0};

  Point toSurface(double clientX, double clientY) const {
    return {(clientX - originX) / zoom, (clientY - originY) / zoom};
  }
};

OpResult validateConfig(const SurfaceConfig& cfg);
OpResult validateMapping(const SurfaceMapping& mapping);

} // namespace sc
