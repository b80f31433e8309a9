#include "pc/style/SliceColor.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>

namespace pc {

double colorForIndex(int sliceIndex, const SlicePalette& palette) {
  double harmonic = 0.0;
  for (int k = 1; k <= sliceIndex; k++) {
    harmonic += 1.0 / static_cast<double>(k);
  }
  return std::max(0.0, palette.base - palette.decay * harmonic);
}

std::vector<double> colorRamp(int count, const SlicePalette& palette) {
  std::vector<double> out;
  if (count <= 0) return out;
  out.reserve(static_cast<std::size_t>(count));
  double harmonic = 0.0;
  for (int i = 0; i < count; i++) {
    if (i > 0) harmonic += 1.0 / static_cast<double>(i);
    out.push_back(std::max(0.0, palette.base - palette.decay * harmonic));
  }
  return out;
}

static int channel(double v) {
  return static_cast<int>(std::lround(std::clamp(v, 0.0, 255.0)));
}

std::string fillForColor(double red, const SlicePalette& palette) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "rgb(%d, %d, %d)",
                channel(red), channel(palette.green), channel(palette.blue));
  return buf;
}

std::string fillForIndex(int sliceIndex, const SlicePalette& palette) {
  return fillForColor(colorForIndex(sliceIndex, palette), palette);
}

} // namespace pc
