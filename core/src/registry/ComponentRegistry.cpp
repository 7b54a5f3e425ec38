#include "sc/registry/ComponentRegistry.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace sc {

ComponentRegistry::~ComponentRegistry() {
  clear();
}

void ComponentRegistry::setHost(const SurfaceHost& host) {
  host_ = host;
}

OpResult ComponentRegistry::notFound(const char* op, const ComponentId& id) {
  return opFail(ErrorCode::NotFound, std::string(op) + ": unknown component '" + id + "'");
}

PlacedComponent* ComponentRegistry::find(const ComponentId& id) {
  for (auto& c : components_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

const PlacedComponent* ComponentRegistry::get(const ComponentId& id) const {
  for (const auto& c : components_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

void ComponentRegistry::present(const PlacedComponent& c) const {
  if (!host_.applyTransform) return;
  PresentationState ps;
  ps.position = c.position;
  ps.zOrder = c.zOrder;
  ps.visible = c.visible;
  ps.locked = c.locked;
  host_.applyTransform(c.handle, ps);
}

void ComponentRegistry::releaseHandle(const PlacedComponent& c) const {
  if (host_.release && c.handle != kInvalidHandle) host_.release(c.handle);
}

OpResult ComponentRegistry::add(const ComponentId& id, HandleId handle,
                                const Point& initialPosition, const std::string& kind) {
  if (get(id)) {
    return opFail(ErrorCode::DuplicateId, "add: component '" + id + "' already exists");
  }

  if (maxZOrder() == std::numeric_limits<int>::max()) normalizeZOrder();

  PlacedComponent c;
  c.id = id;
  c.handle = handle;
  c.position = initialPosition;
  if (host_.measure) c.size = host_.measure(handle);
  c.zOrder = maxZOrder() + 1;
  c.kind = kind.empty() ? std::string("unknown") : kind;

  components_.push_back(c);
  present(components_.back());
  return opOk();
}

OpResult ComponentRegistry::remove(const ComponentId& id) {
  auto it = std::find_if(components_.begin(), components_.end(),
                         [&id](const PlacedComponent& c) { return c.id == id; });
  if (it == components_.end()) return notFound("remove", id);

  PlacedComponent removed = std::move(*it);
  components_.erase(it);
  releaseHandle(removed);
  return opOk();
}

void ComponentRegistry::clear() {
  // Detach first so release callbacks observe an empty registry.
  std::vector<PlacedComponent> old;
  old.swap(components_);
  for (const auto& c : old) releaseHandle(c);
}

std::vector<PlacedComponent> ComponentRegistry::getAll() const {
  std::vector<PlacedComponent> out = components_;
  std::stable_sort(out.begin(), out.end(),
                   [](const PlacedComponent& a, const PlacedComponent& b) {
                     return a.zOrder < b.zOrder;
                   });
  return out;
}

OpResult ComponentRegistry::lock(const ComponentId& id) {
  auto* c = find(id);
  if (!c) return notFound("lock", id);
  c->locked = true;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::unlock(const ComponentId& id) {
  auto* c = find(id);
  if (!c) return notFound("unlock", id);
  c->locked = false;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::hide(const ComponentId& id) {
  auto* c = find(id);
  if (!c) return notFound("hide", id);
  c->visible = false;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::show(const ComponentId& id) {
  auto* c = find(id);
  if (!c) return notFound("show", id);
  c->visible = true;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::setPosition(const ComponentId& id, const Point& position) {
  auto* c = find(id);
  if (!c) return notFound("setPosition", id);
  c->position = position;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::setZOrder(const ComponentId& id, int zOrder) {
  auto* c = find(id);
  if (!c) return notFound("setZOrder", id);
  c->zOrder = zOrder;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::resize(const ComponentId& id, const Size& size) {
  auto* c = find(id);
  if (!c) return notFound("resize", id);
  c->size = size;
  present(*c);
  return opOk();
}

OpResult ComponentRegistry::setPayload(const ComponentId& id, const std::string& payload) {
  auto* c = find(id);
  if (!c) return notFound("setPayload", id);
  c->payload = payload;
  return opOk();
}

OpResult ComponentRegistry::setKind(const ComponentId& id, const std::string& kind) {
  auto* c = find(id);
  if (!c) return notFound("setKind", id);
  c->kind = kind.empty() ? std::string("unknown") : kind;
  return opOk();
}

int ComponentRegistry::maxZOrder() const {
  int maxZ = 0;
  for (const auto& c : components_) maxZ = std::max(maxZ, c.zOrder);
  return maxZ;
}

void ComponentRegistry::normalizeZOrder() {
  std::vector<int> levels;
  levels.reserve(components_.size());
  for (const auto& c : components_) levels.push_back(c.zOrder);
  std::sort(levels.begin(), levels.end());
  levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

  for (auto& c : components_) {
    int rank = static_cast<int>(
        std::lower_bound(levels.begin(), levels.end(), c.zOrder) - levels.begin());
    if (rank == c.zOrder) continue;
    c.zOrder = rank;
    present(c);
  }
}

} // namespace sc
