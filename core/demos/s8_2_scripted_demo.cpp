// S8.2 — Scripted console host
// Places a few components, drives a mouse drag and a touch drag through the
// surface, prints every event and host transform, then exports and re-imports
// the arrangement as JSON.

#include "sc/ids/Id.hpp"
#include "sc/surface/SurfaceManager.hpp"

#include <cstdio>
#include <map>
#include <string>

namespace {

struct ConsoleHost {
  std::map<sc::HandleId, sc::Size> sizes;
  sc::HandleId nextHandle{1};

  sc::HandleId create(const sc::Size& size) {
    sc::HandleId h = nextHandle++;
    sizes[h] = size;
    return h;
  }

  sc::SurfaceHost host() {
    sc::SurfaceHost h;
    h.measure = [this](sc::HandleId handle) {
      auto it = sizes.find(handle);
      return it == sizes.end() ? sc::Size{} : it->second;
    };
    h.applyTransform = [](sc::HandleId handle, const sc::PresentationState& s) {
      std::printf("    host: #%llu -> (%.0f, %.0f) z=%d%s%s\n",
                  static_cast<unsigned long long>(handle), s.position.x, s.position.y,
                  s.zOrder, s.visible ? "" : " hidden", s.locked ? " locked" : "");
    };
    h.release = [this](sc::HandleId handle) {
      std::printf("    host: release #%llu\n", static_cast<unsigned long long>(handle));
      sizes.erase(handle);
    };
    return h;
  }
};

void step(sc::SurfaceManager& sm, const sc::PointerEvent& ev, const char* label) {
  bool handled = sm.processPointer(ev);
  std::printf("  %-28s %s\n", label, handled ? "handled" : "ignored");
}

} // namespace

int main() {
  ConsoleHost console;
  sc::SurfaceManager sm(800, 600, console.host());

  sc::SurfaceConfig cfg;
  cfg.gridSize = 20;
  if (!sm.setConfig(cfg).ok) return 1;

  sm.subscribe([](const sc::DragEvent& e) {
    std::printf("  event: %s %s (%.0f, %.0f)\n", sc::toString(e.type), e.id.c_str(),
                e.position.x, e.position.y);
  });

  std::printf("Placing components\n");
  const std::string note = sc::generateComponentId("note");
  sm.addComponent("A", console.create({100, 50}), {50, 50}, "card");
  sm.addComponent("B", console.create({120, 80}), {300, 200}, "card");
  sc::Point free = sm.findOptimalPlacement({60, 60});
  sm.addComponent(note, console.create({60, 60}), free, "note");
  sm.lockComponent("B");

  std::printf("Mouse drag of A\n");
  step(sm, sc::mouseEvent(sc::PointerPhase::Down, 75, 75), "mouse down (75,75)");
  step(sm, sc::mouseEvent(sc::PointerPhase::Move, 500, 500), "mouse move (500,500)");
  step(sm, sc::mouseEvent(sc::PointerPhase::Move, 900, 900), "mouse move (900,900)");
  step(sm, sc::mouseEvent(sc::PointerPhase::Up, 0, 0), "mouse up");

  std::printf("Pointer down on locked B\n");
  step(sm, sc::mouseEvent(sc::PointerPhase::Down, 310, 210), "mouse down (310,210)");

  std::printf("Touch drag of %s at zoom 2\n", note.c_str());
  sc::SurfaceMapping zoomed;
  zoomed.zoom = 2.0;
  sm.setMapping(zoomed);
  const sc::Point at = sm.getComponent(note)->position;
  step(sm, sc::touchEvent(sc::PointerPhase::Down, (at.x + 5) * 2, (at.y + 5) * 2),
       "touch start");
  step(sm, sc::mouseEvent(sc::PointerPhase::Move, 100, 100), "stray mouse move");
  step(sm, sc::touchEvent(sc::PointerPhase::Move, 400, 800), "touch move");
  step(sm, sc::touchEvent(sc::PointerPhase::Cancel, 0, 0), "touch cancel");

  std::printf("Export\n");
  const std::string json = sm.exportJSON();
  std::printf("%s\n", json.c_str());

  std::printf("Re-import\n");
  bool ok = sm.importJSON(json, [&console](const sc::ComponentRecord& rec) {
    return console.create(rec.size);
  });
  std::printf("  import %s, %zu components\n", ok ? "ok" : "failed", sm.componentCount());

  std::printf("Detach\n");
  sm.detach();
  return ok ? 0 : 1;
}
