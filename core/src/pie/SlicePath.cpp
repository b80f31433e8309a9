#include "pc/pie/SlicePath.hpp"

#include <cstdio>

namespace pc {

SlicePath& SlicePath::moveTo(Point p) {
  PathCommand c;
  c.op = PathOp::MoveTo;
  c.to = p;
  commands_.push_back(c);
  return *this;
}

SlicePath& SlicePath::lineTo(Point p) {
  PathCommand c;
  c.op = PathOp::LineTo;
  c.to = p;
  commands_.push_back(c);
  return *this;
}

SlicePath& SlicePath::arcTo(double rx, double ry, int largeArc, int sweep, Point p) {
  PathCommand c;
  c.op = PathOp::ArcTo;
  c.to = p;
  c.rx = rx;
  c.ry = ry;
  c.largeArc = largeArc;
  c.sweep = sweep;
  commands_.push_back(c);
  return *this;
}

SlicePath& SlicePath::close() {
  PathCommand c;
  c.op = PathOp::Close;
  commands_.push_back(c);
  return *this;
}

std::string formatCoord(double v) {
  // Keep tiny trig residue (e.g. 1e-14) from leaking into the output.
  if (v > -1e-9 && v < 1e-9) v = 0.0;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.9g", v);
  return buf;
}

static void appendPoint(std::string& out, Point p) {
  out += formatCoord(p.x);
  out += ',';
  out += formatCoord(p.y);
}

std::string SlicePath::toSvgPathData() const {
  std::string out;
  for (const auto& c : commands_) {
    switch (c.op) {
      case PathOp::MoveTo:
        out += 'M';
        appendPoint(out, c.to);
        break;
      case PathOp::LineTo:
        out += 'L';
        appendPoint(out, c.to);
        break;
      case PathOp::ArcTo:
        out += 'A';
        out += formatCoord(c.rx);
        out += ',';
        out += formatCoord(c.ry);
        out += ",0,";
        out += std::to_string(c.largeArc);
        out += ',';
        out += std::to_string(c.sweep);
        out += ',';
        appendPoint(out, c.to);
        break;
      case PathOp::Close:
        out += 'Z';
        break;
    }
  }
  return out;
}

} // namespace pc
