#include "sc/layout/LayoutUtils.hpp"
#include "sc/registry/ComponentRegistry.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sc {

namespace {

OpResult requireAll(const ComponentRegistry& reg, const std::vector<ComponentId>& ids,
                    const char* op, std::vector<const PlacedComponent*>& out) {
  out.clear();
  out.reserve(ids.size());
  for (const auto& id : ids) {
    const auto* c = reg.get(id);
    if (!c) {
      return opFail(ErrorCode::NotFound, std::string(op) + ": unknown component '" + id + "'");
    }
    out.push_back(c);
  }
  return opOk();
}

} // namespace

Point findOptimalPlacement(const std::vector<PlacedComponent>& existing, const Size& size,
                           const Bounds& bounds, const PlacementConfig& cfg) {
  const Point fallback{bounds.left + cfg.margin, bounds.top + cfg.margin};
  if (!(cfg.step > 0.0)) return fallback;

  for (double y = bounds.top + cfg.margin; y + size.height <= bounds.bottom; y += cfg.step) {
    for (double x = bounds.left + cfg.margin; x + size.width <= bounds.right; x += cfg.step) {
      Rect test = rectAt({x, y}, size);
      bool conflict = false;
      for (const auto& c : existing) {
        if (c.visible && rectOverlap(test, c.rect())) {
          conflict = true;
          break;
        }
      }
      if (!conflict) return {x, y};
    }
  }
  return fallback;
}

OpResult alignComponents(ComponentRegistry& reg, const std::vector<ComponentId>& ids,
                         AlignEdge edge) {
  std::vector<const PlacedComponent*> comps;
  OpResult check = requireAll(reg, ids, "alignComponents", comps);
  if (!check.ok) return check;
  if (comps.size() < 2) return opOk();

  // Targets first; setPosition only touches the record it is given.
  std::vector<Point> targets;
  targets.reserve(comps.size());

  switch (edge) {
    case AlignEdge::Left: {
      double v = comps[0]->position.x;
      for (const auto* c : comps) v = std::min(v, c->position.x);
      for (const auto* c : comps) targets.push_back({v, c->position.y});
      break;
    }
    case AlignEdge::Right: {
      double v = comps[0]->position.x + comps[0]->size.width;
      for (const auto* c : comps) v = std::max(v, c->position.x + c->size.width);
      for (const auto* c : comps) targets.push_back({v - c->size.width, c->position.y});
      break;
    }
    case AlignEdge::Top: {
      double v = comps[0]->position.y;
      for (const auto* c : comps) v = std::min(v, c->position.y);
      for (const auto* c : comps) targets.push_back({c->position.x, v});
      break;
    }
    case AlignEdge::Bottom: {
      double v = comps[0]->position.y + comps[0]->size.height;
      for (const auto* c : comps) v = std::max(v, c->position.y + c->size.height);
      for (const auto* c : comps) targets.push_back({c->position.x, v - c->size.height});
      break;
    }
    case AlignEdge::CenterHorizontal: {
      double sum = 0.0;
      for (const auto* c : comps) sum += c->position.x;
      double mean = sum / static_cast<double>(comps.size());
      for (const auto* c : comps) targets.push_back({mean - c->size.width / 2.0, c->position.y});
      break;
    }
    case AlignEdge::CenterVertical: {
      double sum = 0.0;
      for (const auto* c : comps) sum += c->position.y;
      double mean = sum / static_cast<double>(comps.size());
      for (const auto* c : comps) targets.push_back({c->position.x, mean - c->size.height / 2.0});
      break;
    }
    default:
      return opFail(ErrorCode::InvalidConfiguration, "alignComponents: unknown edge");
  }

  for (std::size_t i = 0; i < ids.size(); ++i) {
    OpResult r = reg.setPosition(ids[i], targets[i]);
    if (!r.ok) return r;
  }
  return opOk();
}

OpResult distributeComponents(ComponentRegistry& reg, const std::vector<ComponentId>& ids,
                              DistributeAxis axis) {
  std::vector<const PlacedComponent*> comps;
  OpResult check = requireAll(reg, ids, "distributeComponents", comps);
  if (!check.ok) return check;
  if (comps.size() < 3) {
    return opFail(ErrorCode::InsufficientComponents,
                  "distributeComponents: needs at least 3 components (got " +
                  std::to_string(comps.size()) + ")");
  }

  const bool horizontal = axis == DistributeAxis::Horizontal;
  auto coord = [horizontal](const PlacedComponent* c) {
    return horizontal ? c->position.x : c->position.y;
  };

  std::stable_sort(comps.begin(), comps.end(),
                   [&coord](const PlacedComponent* a, const PlacedComponent* b) {
                     return coord(a) < coord(b);
                   });

  const double first = coord(comps.front());
  const double last = coord(comps.back());
  const double spacing = (last - first) / static_cast<double>(comps.size() - 1);

  std::vector<std::pair<ComponentId, Point>> targets;
  targets.reserve(comps.size());
  for (std::size_t i = 0; i < comps.size(); ++i) {
    Point p = comps[i]->position;
    double v = (i + 1 == comps.size()) ? last : first + spacing * static_cast<double>(i);
    if (horizontal) p.x = v; else p.y = v;
    targets.emplace_back(comps[i]->id, p);
  }

  for (const auto& t : targets) {
    OpResult r = reg.setPosition(t.first, t.second);
    if (!r.ok) return r;
  }
  return opOk();
}

} // namespace sc
