#pragma once
#include <string>
#include <vector>

namespace pc {

// Sequential red shade ramp used to fill slices.
struct SlicePalette {
  double base{255.0};     // red channel of slice 0
  double decay{75.0};     // slowing decrement: slice k loses decay / k
  double green{40.0};
  double blue{40.0};
};

// Red channel for the slice at sliceIndex (0-based).
// base - decay * (1 + 1/2 + ... + 1/sliceIndex), clamped at 0.
// O(sliceIndex); use colorRamp() when coloring a whole chart.
double colorForIndex(int sliceIndex, const SlicePalette& palette = SlicePalette{});

// colorForIndex(0) .. colorForIndex(count - 1) in one O(count) pass.
std::vector<double> colorRamp(int count, const SlicePalette& palette = SlicePalette{});

// CSS/SVG fill string, e.g. "rgb(255, 40, 40)".
std::string fillForIndex(int sliceIndex, const SlicePalette& palette = SlicePalette{});

// Fill string for an already computed red channel.
std::string fillForColor(double red, const SlicePalette& palette = SlicePalette{});

} // namespace pc
