#include "sc/events/EventEmitter.hpp"

#include <algorithm>
#include <utility>

namespace sc {

ListenerId EventEmitter::subscribe(DragListener listener) {
  if (!listener) return kInvalidListener;
  ListenerId id = nextId_++;
  listeners_.push_back({id, std::move(listener)});
  return id;
}

bool EventEmitter::unsubscribe(ListenerId id) {
  auto before = listeners_.size();
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
      [id](const Entry& e) { return e.id == id; }),
    listeners_.end());
  return listeners_.size() != before;
}

bool EventEmitter::isSubscribed(ListenerId id) const {
  return std::any_of(listeners_.begin(), listeners_.end(),
                     [id](const Entry& e) { return e.id == id; });
}

void EventEmitter::clear() {
  listeners_.clear();
}

void EventEmitter::emit(const DragEvent& ev) const {
  // Copy so listeners may unsubscribe during dispatch; a listener removed
  // mid-dispatch is skipped for the rest of this event.
  auto snapshot = listeners_;
  for (const auto& e : snapshot) {
    if (!isSubscribed(e.id)) continue;
    e.fn(ev);
  }
}

} // namespace sc
