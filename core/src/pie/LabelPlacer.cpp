#include "pc/pie/LabelPlacer.hpp"
#include "pc/math/Polar.hpp"
#include "pc/text/NumberFormat.hpp"

#include <utility>

namespace pc {

double labelRadius(LabelPosition position, double radius, double labelOffset) {
  switch (position) {
    case LabelPosition::Inside:  return radius / 2.0 + labelOffset;
    case LabelPosition::Outside: return radius + labelOffset;
    case LabelPosition::Center:  return labelOffset;
  }
  return radius / 2.0 + labelOffset;
}

std::vector<LabelAnchor> placeLabelAnchors(const AngleWalk& walk,
                                           Point center, double radius) {
  std::vector<LabelAnchor> anchors;
  anchors.reserve(walk.steps.size());
  for (const auto& step : walk.steps) {
    LabelAnchor a;
    if (!step.zero) {
      a.point = polarToCartesian(center, radius, step.midAngle());
      a.suppressed = false;
    }
    anchors.push_back(a);
  }
  return anchors;
}

std::vector<LabelEntry> resolveLabelTexts(const std::vector<LabelAnchor>& anchors,
                                          const std::vector<double>& series,
                                          const PieChartConfig& config) {
  std::vector<LabelEntry> entries;
  if (!config.hasLabels && !config.showLabels) return entries;

  entries.reserve(anchors.size());
  for (std::size_t i = 0; i < anchors.size(); i++) {
    LabelEntry e;
    e.anchor = anchors[i];
    if (!e.anchor.suppressed) {
      if (config.hasLabels) {
        if (i < config.labels.size()) {
          e.text = config.labels[i];
          e.hasText = true;
        }
      } else if (i < series.size()) {
        e.text = config.labelInterpolation ? config.labelInterpolation(series[i])
                                           : formatValue(series[i]);
        e.hasText = true;
      }
    }
    entries.push_back(std::move(e));
  }
  return entries;
}

} // namespace pc
