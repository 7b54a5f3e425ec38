#pragma once
#include "sc/core/OpResult.hpp"
#include "sc/geometry/Geometry.hpp"
#include "sc/ids/Id.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sc {

// What the host needs to position a handle. Never touches content.
struct PresentationState {
  Point position;
  int zOrder{0};
  bool visible{true};
  bool locked{false};
};

// Host callbacks. Any of them may be left empty.
struct SurfaceHost {
  std::function<Size(HandleId)> measure;                                   // probed once on add
  std::function<void(HandleId, const PresentationState&)> applyTransform;  // after every mutation
  std::function<void(HandleId)> release;                                   // on remove / clear
};

struct PlacedComponent {
  ComponentId id;
  HandleId handle{kInvalidHandle};
  Point position;        // top-left, surface-local
  Size size;
  int zOrder{0};
  bool locked{false};
  bool visible{true};
  std::string kind{"unknown"};
  std::string payload;   // opaque host data

  Rect rect() const { return rectAt(position, size); }
};

// Canonical store of placed components. Owns the handles it holds.
// Pointers returned by get() stay valid until the next add/remove/clear.
class ComponentRegistry {
public:
  ComponentRegistry() = default;
  ~ComponentRegistry();

  ComponentRegistry(const ComponentRegistry&) = delete;
  ComponentRegistry& operator=(const ComponentRegistry&) = delete;

  void setHost(const SurfaceHost& host);

  OpResult add(const ComponentId& id, HandleId handle, const Point& initialPosition,
               const std::string& kind = "unknown");
  OpResult remove(const ComponentId& id);
  void clear();

  const PlacedComponent* get(const ComponentId& id) const;
  bool contains(const ComponentId& id) const { return get(id) != nullptr; }

  // Ascending zOrder; ties keep insertion order.
  std::vector<PlacedComponent> getAll() const;

  // Insertion order.
  const std::vector<PlacedComponent>& components() const { return components_; }
  std::size_t count() const { return components_.size(); }

  OpResult lock(const ComponentId& id);
  OpResult unlock(const ComponentId& id);
  OpResult hide(const ComponentId& id);
  OpResult show(const ComponentId& id);

  OpResult setPosition(const ComponentId& id, const Point& position);
  OpResult setZOrder(const ComponentId& id, int zOrder);
  OpResult resize(const ComponentId& id, const Size& size);
  OpResult setPayload(const ComponentId& id, const std::string& payload);
  OpResult setKind(const ComponentId& id, const std::string& kind);

  // Linear scan; 0 when empty.
  int maxZOrder() const;

  // Renumbers zOrder to dense ranks 0..k-1. Relative order and ties are kept.
  // Used before an increment would leave the int range.
  void normalizeZOrder();

private:
  PlacedComponent* find(const ComponentId& id);
  void present(const PlacedComponent& c) const;
  void releaseHandle(const PlacedComponent& c) const;
  static OpResult notFound(const char* op, const ComponentId& id);

  SurfaceHost host_;
  std::vector<PlacedComponent> components_;
};

} // namespace sc
