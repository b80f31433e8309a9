#pragma once
#include "pc/geom/Point.hpp"
#include <string>
#include <vector>

namespace pc {

enum class PathOp : unsigned char {
  MoveTo,
  LineTo,
  ArcTo,   // elliptical arc, x-axis rotation always 0
  Close
};

inline const char* toString(PathOp op) {
  switch (op) {
    case PathOp::MoveTo: return "moveTo";
    case PathOp::LineTo: return "lineTo";
    case PathOp::ArcTo: return "arcTo";
    case PathOp::Close: return "close";
    default: return "unknown";
  }
}

struct PathCommand {
  PathOp op{PathOp::MoveTo};
  Point to;            // unused by Close
  double rx{0}, ry{0}; // ArcTo only
  int largeArc{0};     // ArcTo only
  int sweep{0};        // ArcTo only: 1 = clockwise on screen
};

// Structured vector path for one slice. Renderers either walk the commands
// directly (canvas, immediate-mode UI) or take toSvgPathData().
class SlicePath {
public:
  SlicePath& moveTo(Point p);
  SlicePath& lineTo(Point p);
  SlicePath& arcTo(double rx, double ry, int largeArc, int sweep, Point p);
  SlicePath& close();

  const std::vector<PathCommand>& commands() const { return commands_; }
  bool empty() const { return commands_.empty(); }

  // Compact SVG path data: "M300,30A170,170,0,0,0,...L300,200Z".
  std::string toSvgPathData() const;

private:
  std::vector<PathCommand> commands_;
};

// Shared number formatting for path data and exports (%.9g).
std::string formatCoord(double v);

} // namespace pc
