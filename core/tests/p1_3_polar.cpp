// P1.3 — polarToCartesian angle convention
// 0 degrees = 12 o'clock, clockwise with the y axis pointing down.

#include "pc/math/Polar.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  const pc::Point c{300.0, 200.0};

  // --- Test 1: cardinal directions ---
  {
    pc::Point p0 = pc::polarToCartesian(c, 170.0, 0.0);
    requireNear(p0.x, 300.0, 1e-9, "0deg x");
    requireNear(p0.y, 30.0, 1e-9, "0deg y (up)");

    pc::Point p90 = pc::polarToCartesian(c, 170.0, 90.0);
    requireNear(p90.x, 470.0, 1e-9, "90deg x (right)");
    requireNear(p90.y, 200.0, 1e-9, "90deg y");

    pc::Point p180 = pc::polarToCartesian(c, 170.0, 180.0);
    requireNear(p180.x, 300.0, 1e-9, "180deg x");
    requireNear(p180.y, 370.0, 1e-9, "180deg y (down)");

    pc::Point p270 = pc::polarToCartesian(c, 170.0, 270.0);
    requireNear(p270.x, 130.0, 1e-9, "270deg x (left)");
    requireNear(p270.y, 200.0, 1e-9, "270deg y");
    std::printf("  Test 1 (cardinal directions): PASS\n");
  }

  // --- Test 2: periodicity and negative angles ---
  {
    pc::Point a = pc::polarToCartesian(c, 50.0, -60.0);
    pc::Point b = pc::polarToCartesian(c, 50.0, 300.0);
    requireNear(a.x, b.x, 1e-9, "-60 == 300 (x)");
    requireNear(a.y, b.y, 1e-9, "-60 == 300 (y)");
    std::printf("  Test 2 (periodicity): PASS\n");
  }

  // --- Test 3: zero radius is the center ---
  {
    pc::Point p = pc::polarToCartesian(c, 0.0, 123.0);
    requireNear(p.x, 300.0, 1e-12, "r=0 x");
    requireNear(p.y, 200.0, 1e-12, "r=0 y");
    std::printf("  Test 3 (zero radius): PASS\n");
  }

  // --- Test 4: distance from center equals radius ---
  {
    for (int deg = 0; deg < 360; deg += 15) {
      pc::Point p = pc::polarToCartesian(c, 85.0, static_cast<double>(deg));
      double d = std::hypot(p.x - c.x, p.y - c.y);
      requireNear(d, 85.0, 1e-9, "distance == radius");
    }
    std::printf("  Test 4 (distance == radius): PASS\n");
  }

  std::printf("\nAll polar tests passed.\n");
  return 0;
}
