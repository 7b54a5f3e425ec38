#pragma once
#include "sc/constraint/ConstraintEngine.hpp"
#include "sc/events/EventEmitter.hpp"
#include "sc/interaction/DragInteraction.hpp"
#include "sc/layout/LayoutUtils.hpp"
#include "sc/registry/ComponentRegistry.hpp"
#include "sc/serialization/Serialization.hpp"
#include "sc/surface/SurfaceConfig.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sc {

// One bounded surface: registry, constraints, pointer session and events.
// Single-threaded; every call runs to completion on the host's event thread.
class SurfaceManager {
public:
  SurfaceManager(double surfaceWidth, double surfaceHeight, const SurfaceHost& host = {});
  ~SurfaceManager();

  SurfaceManager(const SurfaceManager&) = delete;
  SurfaceManager& operator=(const SurfaceManager&) = delete;

  // Configuration. Invalid input leaves the previous state active.
  OpResult setConfig(const SurfaceConfig& cfg);
  const SurfaceConfig& config() const { return config_; }
  OpResult setSurfaceSize(double width, double height);
  Size surfaceSize() const { return surface_; }
  const Bounds& boundaries() const { return constraints_.bounds(); }
  OpResult setMapping(const SurfaceMapping& mapping);
  const SurfaceMapping& mapping() const { return mapping_; }

  // Components
  OpResult addComponent(const ComponentId& id, HandleId handle, const Point& initialPosition,
                        const std::string& kind = "unknown");
  OpResult removeComponent(const ComponentId& id);
  const PlacedComponent* getComponent(const ComponentId& id) const;
  std::vector<PlacedComponent> getAllComponents() const;
  std::size_t componentCount() const { return registry_.count(); }
  void clear();

  OpResult lockComponent(const ComponentId& id);
  OpResult unlockComponent(const ComponentId& id);
  OpResult hideComponent(const ComponentId& id);
  OpResult showComponent(const ComponentId& id);

  // Clamped to the boundaries; no snapping or collision resolution.
  OpResult setComponentPosition(const ComponentId& id, const Point& position);
  OpResult resizeComponent(const ComponentId& id, const Size& size);
  OpResult setPayload(const ComponentId& id, const std::string& payload);

  OpResult bringToFront(const ComponentId& id);
  OpResult sendToBack(const ComponentId& id);

  // Visible components overlapping id's rectangle; empty for an unknown id.
  std::vector<ComponentId> findCollisions(const ComponentId& id) const;

  // Pointer input
  bool processPointer(const PointerEvent& ev);
  bool isDragging() const { return drag_.isDragging(); }
  const ComponentId& draggedId() const { return drag_.draggedId(); }

  // Events
  ListenerId subscribe(DragListener listener);
  bool unsubscribe(ListenerId id);

  // Persistence
  std::vector<ComponentRecord> serialize() const;
  std::size_t deserialize(std::vector<ComponentRecord> records, const HandleFactory& factory);
  std::string exportJSON() const;
  bool importJSON(const std::string& json, const HandleFactory& factory);

  // Layout (writes positions directly, no collision resolution)
  Point findOptimalPlacement(const Size& size, const PlacementConfig& cfg = {}) const;
  OpResult alignComponents(const std::vector<ComponentId>& ids, AlignEdge edge);
  OpResult distributeComponents(const std::vector<ComponentId>& ids, DistributeAxis axis);

  // Teardown: drops any session silently, releases every handle, clears listeners.
  void detach();

  const ComponentRegistry& registry() const { return registry_; }
  const ConstraintEngine& constraints() const { return constraints_; }

private:
  Bounds effectiveBounds(const SurfaceConfig& cfg) const;

  ComponentRegistry registry_;
  ConstraintEngine constraints_;
  EventEmitter emitter_;
  DragInteraction drag_;

  SurfaceConfig config_;
  SurfaceMapping mapping_;
  Size surface_;
};

} // namespace sc
