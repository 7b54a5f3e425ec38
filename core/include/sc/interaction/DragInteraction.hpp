#pragma once
#include "sc/events/EventEmitter.hpp"
#include "sc/geometry/Geometry.hpp"
#include "sc/ids/Id.hpp"
#include "sc/interaction/PointerInput.hpp"
#include "sc/surface/SurfaceConfig.hpp"

#include <cstdint>

namespace sc {

class ComponentRegistry;
class ConstraintEngine;

// Pointer session state machine.
// States: Idle -> Dragging (pointer-down on an unlocked, visible component)
//         Dragging -> Idle (pointer-up / cancel from the owning modality)
enum class DragMode : std::uint8_t {
  Idle = 0,
  Dragging
};

class DragInteraction {
public:
  void setRegistry(ComponentRegistry* reg) { reg_ = reg; }
  void setConstraints(const ConstraintEngine* ce) { ce_ = ce; }
  void setEmitter(const EventEmitter* em) { emitter_ = em; }
  void setMapping(const SurfaceMapping& mapping) { mapping_ = mapping; }

  // Maps client coordinates to the surface and dispatches on phase.
  // Returns true if the event was consumed by the state machine.
  bool processPointer(const PointerEvent& ev);

  // Surface-local entry points.
  bool pointerDown(const Point& pos, PointerSource source);
  bool pointerMove(const Point& pos, PointerSource source);
  bool pointerUp(PointerSource source);

  // Ends the session without dragEnd if it is dragging `id`.
  bool abandon(const ComponentId& id);

  // Ends any session without dragEnd.
  void reset();

  // Top-most visible component containing pos, or nullptr.
  const ComponentId* hitTest(const Point& pos) const;

  DragMode mode() const { return mode_; }
  bool isDragging() const { return mode_ == DragMode::Dragging; }
  const ComponentId& draggedId() const { return draggedId_; }
  PointerSource owner() const { return owner_; }
  Point offset() const { return offset_; }
  Point startPosition() const { return startPosition_; }

private:
  void emit(DragEventType type, const Point& pos) const;

  ComponentRegistry* reg_{nullptr};
  const ConstraintEngine* ce_{nullptr};
  const EventEmitter* emitter_{nullptr};
  SurfaceMapping mapping_;

  DragMode mode_{DragMode::Idle};
  ComponentId draggedId_;
  PointerSource owner_{PointerSource::Mouse};
  Point offset_;
  Point startPosition_;
};

} // namespace sc
