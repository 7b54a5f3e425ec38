// S4.1 — Z-order bookkeeping: bringToFront / sendToBack

#include "sc/registry/ComponentRegistry.hpp"
#include "sc/zorder/ZOrder.hpp"

#include <cstdio>
#include <cstdlib>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static int z(const sc::ComponentRegistry& reg, const char* id) {
  return reg.get(id)->zOrder;
}

int main() {
  // ---- Test 1: bringToFront exceeds every other zOrder ----
  {
    sc::ComponentRegistry reg;
    reg.add("a", 1, {0, 0});
    reg.add("b", 2, {0, 0});
    reg.add("c", 3, {0, 0});

    requireTrue(sc::bringToFront(reg, "a").ok, "bringToFront ok");
    requireTrue(z(reg, "a") > z(reg, "b") && z(reg, "a") > z(reg, "c"), "a on top");
    requireTrue(z(reg, "a") == 4, "max + 1");

    int before = z(reg, "a");
    requireTrue(sc::bringToFront(reg, "a").ok, "repeat ok");
    requireTrue(z(reg, "a") == before, "idempotent when already on top");
    std::printf("  Test 1 (bringToFront): PASS\n");
  }

  // ---- Test 2: sendToBack zeroes and shifts others, preserving their order ----
  {
    sc::ComponentRegistry reg;
    reg.add("a", 1, {0, 0});
    reg.add("b", 2, {0, 0});
    reg.add("c", 3, {0, 0});

    requireTrue(sc::sendToBack(reg, "c").ok, "sendToBack ok");
    requireTrue(z(reg, "c") == 0, "c at 0");
    requireTrue(z(reg, "a") == 2 && z(reg, "b") == 3, "others shifted by one");

    auto all = reg.getAll();
    requireTrue(all[0].id == "c" && all[1].id == "a" && all[2].id == "b", "relative order kept");

    requireTrue(sc::sendToBack(reg, "c").ok, "repeat ok");
    requireTrue(z(reg, "c") == 0 && z(reg, "a") == 2 && z(reg, "b") == 3,
                "idempotent when already at back");
    std::printf("  Test 2 (sendToBack): PASS\n");
  }

  // ---- Test 3: sendToBack when another component shares zOrder 0 ----
  {
    sc::ComponentRegistry reg;
    reg.add("a", 1, {0, 0});
    reg.add("b", 2, {0, 0});
    requireTrue(sc::sendToBack(reg, "a").ok, "sendToBack a");
    requireTrue(sc::sendToBack(reg, "b").ok, "sendToBack b");
    requireTrue(z(reg, "b") == 0 && z(reg, "a") == 1, "b strictly behind a");
    std::printf("  Test 3 (back over back): PASS\n");
  }

  // ---- Test 4: unknown ids ----
  {
    sc::ComponentRegistry reg;
    reg.add("a", 1, {0, 0});
    auto r = sc::bringToFront(reg, "nope");
    requireTrue(!r.ok && r.err.code == sc::ErrorCode::NotFound, "bringToFront NotFound");
    r = sc::sendToBack(reg, "nope");
    requireTrue(!r.ok && r.err.code == sc::ErrorCode::NotFound, "sendToBack NotFound");
    requireTrue(z(reg, "a") == 1, "state unchanged");
    std::printf("  Test 4 (not found): PASS\n");
  }

  // ---- Test 5: raising or lowering next to a zOrder of INT_MAX ----
  {
    const int top = std::numeric_limits<int>::max();
    sc::ComponentRegistry reg;
    reg.add("a", 1, {0, 0});
    reg.add("b", 2, {0, 0});
    reg.add("c", 3, {0, 0});
    reg.setZOrder("a", top);
    reg.setZOrder("b", 7);

    requireTrue(sc::bringToFront(reg, "c").ok, "bringToFront past INT_MAX");
    requireTrue(z(reg, "c") > z(reg, "a") && z(reg, "a") > z(reg, "b"), "c, a, b from top");

    reg.setZOrder("c", top);
    requireTrue(sc::sendToBack(reg, "b").ok, "sendToBack beside INT_MAX");
    requireTrue(z(reg, "b") == 0, "b at 0");
    requireTrue(z(reg, "c") > z(reg, "a") && z(reg, "a") > 0, "others above and ordered");
    std::printf("  Test 5 (z range): PASS\n");
  }

  std::printf("S4.1 zorder: ALL PASS\n");
  return 0;
}
