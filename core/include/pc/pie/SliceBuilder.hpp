#pragma once
#include "pc/pie/PieConfig.hpp"
#include "pc/pie/SlicePath.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pc {

// Drawn start of every slice but the first is pulled back by this much so
// anti-aliased edges of neighbours overlap instead of leaving a hairline.
constexpr double kSeamOverlapDeg = 0.4;

// Longest drawable span; a 360 degree arc has coincident end points.
constexpr double kMaxDrawnSpanDeg = 359.99;

// One step of the bookkeeping walk, one per series entry.
struct AngleStep {
  std::size_t seriesIndex{0};
  bool zero{true};          // zero entries own no slice and no angle
  int sliceIndex{-1};       // -1 for zero entries
  double startAngle{0};     // bookkeeping boundaries, never seam-corrected
  double endAngle{0};

  double midAngle() const { return startAngle + (endAngle - startAngle) / 2.0; }
};

// Shared by SliceBuilder and LabelPlacer so both see identical angles.
struct AngleWalk {
  double startAngle{0};
  std::vector<AngleStep> steps;
  int sliceCount{0};
};

AngleWalk walkAngles(const std::vector<double>& normalized,
                     double valuesTotal, double startAngle);

struct SliceDescriptor {
  std::size_t seriesIndex{0};
  int sliceIndex{0};

  double startAngle{0};       // bookkeeping
  double endAngle{0};
  double drawnStartAngle{0};  // after seam overlap
  double drawnEndAngle{0};    // after full-circle clamp
  int largeArc{0};

  SlicePath path;
  double colorValue{0};
  std::string fill;

  double span() const { return endAngle - startAngle; }
};

// Radius of the donut hole, kept within [0, radius].
double donutInnerRadius(double radius, double donutWidth);

// Build one descriptor per non-zero step of the walk.
std::vector<SliceDescriptor> buildSlices(const AngleWalk& walk,
                                         const ChartFrame& frame,
                                         const PieChartConfig& config);

} // namespace pc
