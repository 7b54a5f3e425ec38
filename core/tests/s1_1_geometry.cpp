// S1.1 — Geometry helpers (pure C++)
// Tests: half-open overlap, Euclidean distance, inclusive point-in-rect, containment.

#include "sc/geometry/Geometry.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

int main() {
  // ---- Test 1: overlap is half-open ----
  {
    sc::Rect a{0, 0, 100, 100};
    sc::Rect b{50, 50, 150, 150};
    sc::Rect touchingRight{100, 0, 200, 100};
    sc::Rect touchingBelow{0, 100, 100, 200};
    sc::Rect cornerOnly{100, 100, 200, 200};
    sc::Rect inside{10, 10, 20, 20};
    sc::Rect far{300, 300, 400, 400};

    requireTrue(sc::rectOverlap(a, b), "partial overlap");
    requireTrue(sc::rectOverlap(b, a), "overlap is symmetric");
    requireTrue(!sc::rectOverlap(a, touchingRight), "shared vertical edge is not overlap");
    requireTrue(!sc::rectOverlap(a, touchingBelow), "shared horizontal edge is not overlap");
    requireTrue(!sc::rectOverlap(a, cornerOnly), "shared corner is not overlap");
    requireTrue(sc::rectOverlap(a, inside), "contained rect overlaps");
    requireTrue(!sc::rectOverlap(a, far), "disjoint");
    std::printf("  Test 1 (rectOverlap): PASS\n");
  }

  // ---- Test 2: distance ----
  {
    requireTrue(approx(sc::distance({0, 0}, {3, 4}), 5.0), "3-4-5");
    requireTrue(approx(sc::distance({-1, -1}, {-1, -1}), 0.0), "same point");
    requireTrue(approx(sc::distance({10, 0}, {0, 0}), sc::distance({0, 0}, {10, 0})),
                "symmetric");
    std::printf("  Test 2 (distance): PASS\n");
  }

  // ---- Test 3: pointInRect is inclusive ----
  {
    sc::Rect r{10, 20, 110, 70};
    requireTrue(sc::pointInRect({10, 20}, r), "top-left corner");
    requireTrue(sc::pointInRect({110, 70}, r), "bottom-right corner");
    requireTrue(sc::pointInRect({60, 45}, r), "center");
    requireTrue(!sc::pointInRect({9.999, 45}, r), "just left");
    requireTrue(!sc::pointInRect({60, 70.001}, r), "just below");
    std::printf("  Test 3 (pointInRect): PASS\n");
  }

  // ---- Test 4: rectAt / rectContains ----
  {
    sc::Rect r = sc::rectAt({5, 6}, {10, 20});
    requireTrue(r.left == 5 && r.top == 6 && r.right == 15 && r.bottom == 26, "rectAt edges");
    requireTrue(approx(r.width(), 10) && approx(r.height(), 20), "width/height");

    sc::Rect surface{0, 0, 800, 600};
    requireTrue(sc::rectContains(surface, {0, 0, 800, 600}), "equal rect is contained");
    requireTrue(!sc::rectContains(surface, {700, 550, 801, 600}), "one unit out");
    std::printf("  Test 4 (rectAt/rectContains): PASS\n");
  }

  std::printf("S1.1 geometry: ALL PASS\n");
  return 0;
}
