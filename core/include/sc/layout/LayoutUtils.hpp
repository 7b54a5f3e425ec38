#pragma once
#include "sc/core/OpResult.hpp"
#include "sc/geometry/Geometry.hpp"
#include "sc/ids/Id.hpp"

#include <cstdint>
#include <vector>

namespace sc {

class ComponentRegistry;
struct PlacedComponent;

enum class AlignEdge : std::uint8_t {
  Left = 0,
  Right,
  Top,
  Bottom,
  CenterHorizontal,  // centered on the mean left edge
  CenterVertical     // centered on the mean top edge
};

enum class DistributeAxis : std::uint8_t { Horizontal = 0, Vertical };

struct PlacementConfig {
  double step{20.0};    // raster step
  double margin{10.0};  // inset from bounds; also the saturated fallback
};

// Row-major raster scan; returns the first top-left whose rectangle fits inside
// bounds and overlaps no visible component in `existing`.
// Falls back to (left + margin, top + margin) when the surface is saturated.
Point findOptimalPlacement(const std::vector<PlacedComponent>& existing, const Size& size,
                           const Bounds& bounds, const PlacementConfig& cfg = {});

// Layout helpers write positions directly; they never run collision resolution.

// Fewer than two components is a no-op.
OpResult alignComponents(ComponentRegistry& reg, const std::vector<ComponentId>& ids,
                         AlignEdge edge);

// Requires at least three components; first and last (by axis) stay put.
OpResult distributeComponents(ComponentRegistry& reg, const std::vector<ComponentId>& ids,
                              DistributeAxis axis);

} // namespace sc
