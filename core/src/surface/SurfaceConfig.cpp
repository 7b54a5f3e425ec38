#include "sc/surface/SurfaceConfig.hpp"

#include <cmath>
#include <string>

namespace sc {

OpResult validateConfig(const SurfaceConfig& cfg) {
  if (!(cfg.gridSize > 0.0) || !std::isfinite(cfg.gridSize)) {
    return opFail(ErrorCode::InvalidConfiguration,
                  "gridSize must be > 0 (got " + std::to_string(cfg.gridSize) + ")");
  }
  if (!(cfg.probeOffset > 0.0) || !std::isfinite(cfg.probeOffset)) {
    return opFail(ErrorCode::InvalidConfiguration, "probeOffset must be > 0");
  }
  if (cfg.hasBoundaries) {
    const auto& b = cfg.boundaries;
    if (b.right < b.left || b.bottom < b.top) {
      return opFail(ErrorCode::InvalidConfiguration, "boundaries rectangle is inverted");
    }
  }
  return opOk();
}

OpResult validateMapping(const SurfaceMapping& mapping) {
  if (!(mapping.zoom > 0.0) || !std::isfinite(mapping.zoom)) {
    return opFail(ErrorCode::InvalidConfiguration, "zoom must be > 0");
  }
  return opOk();
}

} // namespace sc
