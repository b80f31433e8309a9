#pragma once

namespace pc {

struct Point {
  double x{0}, y{0};
};

inline bool operator==(const Point& a, const Point& b) {
  return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

} // namespace pc
