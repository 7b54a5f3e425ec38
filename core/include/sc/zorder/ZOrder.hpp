#pragma once
#include "sc/core/OpResult.hpp"
#include "sc/ids/Id.hpp"

namespace sc {

class ComponentRegistry;

// zOrder = max(all) + 1. No-op when id already holds the strict maximum.
OpResult bringToFront(ComponentRegistry& reg, const ComponentId& id);

// zOrder = 0; every other component's zOrder is incremented by one.
// No-op when id is already the strict minimum at 0.
OpResult sendToBack(ComponentRegistry& reg, const ComponentId& id);

} // namespace sc
