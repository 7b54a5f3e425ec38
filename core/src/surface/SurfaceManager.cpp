#include "sc/surface/SurfaceManager.hpp"
#include "sc/core/Log.hpp"
#include "sc/zorder/ZOrder.hpp"

#include <algorithm>
#include <utility>

namespace sc {

SurfaceManager::SurfaceManager(double surfaceWidth, double surfaceHeight,
                               const SurfaceHost& host) {
  if (surfaceWidth < 0.0 || surfaceHeight < 0.0) {
    logMessage("SurfaceManager", "negative surface size %.1fx%.1f clamped to 0",
               surfaceWidth, surfaceHeight);
  }
  surface_ = {std::max(0.0, surfaceWidth), std::max(0.0, surfaceHeight)};

  registry_.setHost(host);
  constraints_.setConfig(config_);
  constraints_.setBounds(effectiveBounds(config_));

  drag_.setRegistry(&registry_);
  drag_.setConstraints(&constraints_);
  drag_.setEmitter(&emitter_);
  drag_.setMapping(mapping_);
}

SurfaceManager::~SurfaceManager() {
  detach();
}

Bounds SurfaceManager::effectiveBounds(const SurfaceConfig& cfg) const {
  if (cfg.hasBoundaries) return cfg.boundaries;
  return {0.0, 0.0, surface_.width, surface_.height};
}

OpResult SurfaceManager::setConfig(const SurfaceConfig& cfg) {
  OpResult r = validateConfig(cfg);
  if (!r.ok) {
    logMessage("SurfaceManager", "rejected configuration: %s", r.err.message.c_str());
    return r;
  }
  config_ = cfg;
  constraints_.setConfig(config_);
  constraints_.setBounds(effectiveBounds(config_));
  return opOk();
}

OpResult SurfaceManager::setSurfaceSize(double width, double height) {
  if (width < 0.0 || height < 0.0) {
    return opFail(ErrorCode::InvalidConfiguration, "surface size must be non-negative");
  }
  surface_ = {width, height};
  constraints_.setBounds(effectiveBounds(config_));
  return opOk();
}

OpResult SurfaceManager::setMapping(const SurfaceMapping& mapping) {
  OpResult r = validateMapping(mapping);
  if (!r.ok) return r;
  mapping_ = mapping;
  drag_.setMapping(mapping_);
  return opOk();
}

OpResult SurfaceManager::addComponent(const ComponentId& id, HandleId handle,
                                      const Point& initialPosition, const std::string& kind) {
  return registry_.add(id, handle, initialPosition, kind);
}

OpResult SurfaceManager::removeComponent(const ComponentId& id) {
  if (!registry_.contains(id)) {
    return opFail(ErrorCode::NotFound, "removeComponent: unknown component '" + id + "'");
  }
  drag_.abandon(id);
  return registry_.remove(id);
}

const PlacedComponent* SurfaceManager::getComponent(const ComponentId& id) const {
  return registry_.get(id);
}

std::vector<PlacedComponent> SurfaceManager::getAllComponents() const {
  return registry_.getAll();
}

void SurfaceManager::clear() {
  drag_.reset();
  registry_.clear();
}

OpResult SurfaceManager::lockComponent(const ComponentId& id) { return registry_.lock(id); }
OpResult SurfaceManager::unlockComponent(const ComponentId& id) { return registry_.unlock(id); }
OpResult SurfaceManager::hideComponent(const ComponentId& id) { return registry_.hide(id); }
OpResult SurfaceManager::showComponent(const ComponentId& id) { return registry_.show(id); }

OpResult SurfaceManager::setComponentPosition(const ComponentId& id, const Point& position) {
  const auto* c = registry_.get(id);
  if (!c) {
    return opFail(ErrorCode::NotFound, "setComponentPosition: unknown component '" + id + "'");
  }
  return registry_.setPosition(id, constraints_.clamp(position, c->size));
}

OpResult SurfaceManager::resizeComponent(const ComponentId& id, const Size& size) {
  if (size.width < 0.0 || size.height < 0.0) {
    return opFail(ErrorCode::InvalidConfiguration, "resizeComponent: negative size");
  }
  return registry_.resize(id, size);
}

OpResult SurfaceManager::setPayload(const ComponentId& id, const std::string& payload) {
  return registry_.setPayload(id, payload);
}

OpResult SurfaceManager::bringToFront(const ComponentId& id) {
  return sc::bringToFront(registry_, id);
}

OpResult SurfaceManager::sendToBack(const ComponentId& id) {
  return sc::sendToBack(registry_, id);
}

std::vector<ComponentId> SurfaceManager::findCollisions(const ComponentId& id) const {
  const auto* c = registry_.get(id);
  if (!c) return {};
  return constraints_.findCollisions(registry_, id, c->rect());
}

bool SurfaceManager::processPointer(const PointerEvent& ev) {
  return drag_.processPointer(ev);
}

ListenerId SurfaceManager::subscribe(DragListener listener) {
  return emitter_.subscribe(std::move(listener));
}

bool SurfaceManager::unsubscribe(ListenerId id) {
  return emitter_.unsubscribe(id);
}

std::vector<ComponentRecord> SurfaceManager::serialize() const {
  return sc::serialize(registry_);
}

std::size_t SurfaceManager::deserialize(std::vector<ComponentRecord> records,
                                        const HandleFactory& factory) {
  drag_.reset();
  return sc::deserialize(registry_, std::move(records), factory);
}

std::string SurfaceManager::exportJSON() const {
  return recordsToJSON(serialize());
}

bool SurfaceManager::importJSON(const std::string& json, const HandleFactory& factory) {
  std::vector<ComponentRecord> records;
  if (!recordsFromJSON(json, records)) {
    logMessage("SurfaceManager", "importJSON: unreadable document; state unchanged");
    return false;
  }
  deserialize(std::move(records), factory);
  return true;
}

Point SurfaceManager::findOptimalPlacement(const Size& size, const PlacementConfig& cfg) const {
  return sc::findOptimalPlacement(registry_.components(), size, boundaries(), cfg);
}

OpResult SurfaceManager::alignComponents(const std::vector<ComponentId>& ids, AlignEdge edge) {
  return sc::alignComponents(registry_, ids, edge);
}

OpResult SurfaceManager::distributeComponents(const std::vector<ComponentId>& ids,
                                              DistributeAxis axis) {
  return sc::distributeComponents(registry_, ids, axis);
}

void SurfaceManager::detach() {
  drag_.reset();
  registry_.clear();
  emitter_.clear();
}

} // namespace sc
