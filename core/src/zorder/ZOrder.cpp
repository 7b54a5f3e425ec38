#include "sc/zorder/ZOrder.hpp"
#include "sc/registry/ComponentRegistry.hpp"

#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace sc {

OpResult bringToFront(ComponentRegistry& reg, const ComponentId& id) {
  const auto* c = reg.get(id);
  if (!c) return opFail(ErrorCode::NotFound, "bringToFront: unknown component '" + id + "'");

  int maxOther = 0;
  bool hasOther = false;
  for (const auto& o : reg.components()) {
    if (o.id == id) continue;
    if (!hasOther || o.zOrder > maxOther) maxOther = o.zOrder;
    hasOther = true;
  }
  if (!hasOther || c->zOrder > maxOther) return opOk();

  if (reg.maxZOrder() == std::numeric_limits<int>::max()) reg.normalizeZOrder();
  return reg.setZOrder(id, reg.maxZOrder() + 1);
}

OpResult sendToBack(ComponentRegistry& reg, const ComponentId& id) {
  const auto* c = reg.get(id);
  if (!c) return opFail(ErrorCode::NotFound, "sendToBack: unknown component '" + id + "'");

  bool alreadyBack = c->zOrder == 0;
  for (const auto& o : reg.components()) {
    if (o.id != id && o.zOrder <= 0) alreadyBack = false;
  }
  if (alreadyBack) return opOk();

  if (reg.maxZOrder() == std::numeric_limits<int>::max()) reg.normalizeZOrder();

  std::vector<std::pair<ComponentId, int>> shifted;
  shifted.reserve(reg.count());
  for (const auto& o : reg.components()) {
    if (o.id != id) shifted.emplace_back(o.id, o.zOrder + 1);
  }
  for (const auto& s : shifted) {
    OpResult r = reg.setZOrder(s.first, s.second);
    if (!r.ok) return r;
  }
  return reg.setZOrder(id, 0);
}

} // namespace sc
