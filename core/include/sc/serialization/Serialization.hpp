#pragma once
#include "sc/geometry/Geometry.hpp"
#include "sc/ids/Id.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sc {

class ComponentRegistry;

// Plain snapshot of one placed component. Handle identity is not recorded.
struct ComponentRecord {
  ComponentId id;
  std::string kind{"unknown"};
  Point position;
  Size size;
  int zOrder{0};
  bool locked{false};
  bool visible{true};
  std::string payload;
};

// Recreates a handle for a record; kInvalidHandle skips the record.
using HandleFactory = std::function<HandleId(const ComponentRecord&)>;

// Ascending zOrder.
std::vector<ComponentRecord> serialize(const ComponentRegistry& reg);

// Clears reg, then restores records in ascending stored zOrder.
// Best-effort: unreconstructable records are logged and skipped.
// Returns the number of components restored.
std::size_t deserialize(ComponentRegistry& reg, std::vector<ComponentRecord> records,
                        const HandleFactory& factory);

// {"version":1,"components":[{...}, ...]}
std::string recordsToJSON(const std::vector<ComponentRecord>& records);

// Returns false (out untouched) on parse error or a missing components array.
// Malformed entries are logged and skipped.
bool recordsFromJSON(const std::string& json, std::vector<ComponentRecord>& out);

} // namespace sc
