#pragma once
#include "pc/geom/Point.hpp"
#include <cmath>

namespace pc {

constexpr double kPi = 3.14159265358979323846;

// Project a polar coordinate onto the view box.
// 0 degrees points up (12 o'clock); angles grow clockwise (y axis down).
inline Point polarToCartesian(Point center, double radius, double angleDegrees) {
  double rad = (angleDegrees - 90.0) * kPi / 180.0;
  return Point{center.x + radius * std::cos(rad),
               center.y + radius * std::sin(rad)};
}

} // namespace pc
