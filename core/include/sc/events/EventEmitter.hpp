#pragma once
#include "sc/geometry/Geometry.hpp"
#include "sc/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace sc {

enum class DragEventType : std::uint8_t {
  DragStart = 1,
  ComponentMoved = 2,
  DragEnd = 3
};

inline const char* toString(DragEventType t) {
  switch (t) {
    case DragEventType::DragStart: return "dragStart";
    case DragEventType::ComponentMoved: return "componentMoved";
    case DragEventType::DragEnd: return "dragEnd";
    default: return "unknown";
  }
}

struct DragEvent {
  DragEventType type{DragEventType::DragStart};
  ComponentId id;
  Point position;  // unused for DragStart
};

using DragListener = std::function<void(const DragEvent&)>;

// Synchronous fan-out in subscription order.
class EventEmitter {
public:
  ListenerId subscribe(DragListener listener);
  bool unsubscribe(ListenerId id);
  void clear();

  void emit(const DragEvent& ev) const;

  std::size_t listenerCount() const { return listeners_.size(); }
  bool isSubscribed(ListenerId id) const;

private:
  struct Entry {
    ListenerId id{kInvalidListener};
    DragListener fn;
  };

  std::vector<Entry> listeners_;
  ListenerId nextId_{1};
};

} // namespace sc
