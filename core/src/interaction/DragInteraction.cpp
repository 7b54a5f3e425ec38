#include "sc/interaction/DragInteraction.hpp"
#include "sc/constraint/ConstraintEngine.hpp"
#include "sc/core/Log.hpp"
#include "sc/registry/ComponentRegistry.hpp"
#include "sc/zorder/ZOrder.hpp"

namespace sc {

bool DragInteraction::processPointer(const PointerEvent& ev) {
  switch (ev.phase) {
    case PointerPhase::Down:
      return pointerDown(mapping_.toSurface(ev.clientX, ev.clientY), ev.source);
    case PointerPhase::Move:
      return pointerMove(mapping_.toSurface(ev.clientX, ev.clientY), ev.source);
    case PointerPhase::Up:
    case PointerPhase::Cancel:
      return pointerUp(ev.source);
    default:
      return false;
  }
}

const ComponentId* DragInteraction::hitTest(const Point& pos) const {
  if (!reg_) return nullptr;

  // Later insertion wins a zOrder tie, as it would be painted last.
  const PlacedComponent* top = nullptr;
  for (const auto& c : reg_->components()) {
    if (!c.visible || !pointInRect(pos, c.rect())) continue;
    if (!top || c.zOrder >= top->zOrder) top = &c;
  }
  return top ? &top->id : nullptr;
}

bool DragInteraction::pointerDown(const Point& pos, PointerSource source) {
  if (!reg_ || !ce_) return false;
  if (mode_ == DragMode::Dragging) return false;

  const ComponentId* hit = hitTest(pos);
  if (!hit) return false;

  const PlacedComponent* c = reg_->get(*hit);
  if (!c || c->locked) return false;

  mode_ = DragMode::Dragging;
  draggedId_ = c->id;
  owner_ = source;
  offset_ = {pos.x - c->position.x, pos.y - c->position.y};
  startPosition_ = c->position;

  OpResult r = bringToFront(*reg_, draggedId_);
  if (!r.ok) {
    logMessage("DragInteraction", "bringToFront failed: %s", r.err.message.c_str());
  }

  emit(DragEventType::DragStart, startPosition_);
  return true;
}

bool DragInteraction::pointerMove(const Point& pos, PointerSource source) {
  if (mode_ != DragMode::Dragging || source != owner_) return false;

  const PlacedComponent* c = reg_->get(draggedId_);
  if (!c) {
    logMessage("DragInteraction", "component '%s' removed mid-drag; session dropped",
               draggedId_.c_str());
    reset();
    return false;
  }

  Point candidate{pos.x - offset_.x, pos.y - offset_.y};
  Point next = ce_->constrain(*reg_, *c, candidate);

  OpResult r = reg_->setPosition(draggedId_, next);
  if (!r.ok) {
    logMessage("DragInteraction", "setPosition failed: %s", r.err.message.c_str());
    reset();
    return false;
  }

  emit(DragEventType::ComponentMoved, next);
  return true;
}

bool DragInteraction::pointerUp(PointerSource source) {
  if (mode_ != DragMode::Dragging || source != owner_) return false;

  const PlacedComponent* c = reg_->get(draggedId_);
  if (!c) {
    logMessage("DragInteraction", "component '%s' removed mid-drag; session dropped",
               draggedId_.c_str());
    reset();
    return false;
  }

  Point finalPos = c->position;
  ComponentId id = draggedId_;
  reset();

  if (emitter_) emitter_->emit({DragEventType::DragEnd, id, finalPos});
  return true;
}

bool DragInteraction::abandon(const ComponentId& id) {
  if (mode_ != DragMode::Dragging || draggedId_ != id) return false;
  logMessage("DragInteraction", "component '%s' removed mid-drag; session dropped",
             id.c_str());
  reset();
  return true;
}

void DragInteraction::reset() {
  mode_ = DragMode::Idle;
  draggedId_.clear();
  offset_ = {};
  startPosition_ = {};
}

void DragInteraction::emit(DragEventType type, const Point& pos) const {
  if (!emitter_) return;
  emitter_->emit({type, draggedId_, pos});
}

} // namespace sc
