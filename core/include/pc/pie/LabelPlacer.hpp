#pragma once
#include "pc/geom/Point.hpp"
#include "pc/pie/PieConfig.hpp"
#include "pc/pie/SliceBuilder.hpp"

#include <string>
#include <vector>

namespace pc {

struct LabelAnchor {
  Point point;
  bool suppressed{true};  // zero entry: nothing to label
};

struct LabelEntry {
  LabelAnchor anchor;
  bool hasText{false};
  std::string text;
};

// Inside: radius / 2 + offset, Outside: radius + offset, Center: offset.
double labelRadius(LabelPosition position, double radius, double labelOffset);

// One anchor per series entry, at the bookkeeping midpoint of its slice.
std::vector<LabelAnchor> placeLabelAnchors(const AngleWalk& walk,
                                           Point center, double radius);

// Pair anchors with text. Explicit labels win (paired by series index);
// otherwise, when showLabels is set, the interpolation function or
// formatValue() renders the raw value. Returns an empty list when there is
// nothing to show. Suppressed anchors never carry text.
std::vector<LabelEntry> resolveLabelTexts(const std::vector<LabelAnchor>& anchors,
                                          const std::vector<double>& series,
                                          const PieChartConfig& config);

} // namespace pc
