#include "pc/pie/SliceBuilder.hpp"
#include "pc/math/Polar.hpp"
#include "pc/style/SliceColor.hpp"

#include <algorithm>
#include <utility>

namespace pc {

AngleWalk walkAngles(const std::vector<double>& normalized,
                     double valuesTotal, double startAngle) {
  AngleWalk walk;
  walk.startAngle = startAngle;
  walk.steps.reserve(normalized.size());

  double current = startAngle;
  int sliceIndex = 0;

  for (std::size_t i = 0; i < normalized.size(); i++) {
    AngleStep step;
    step.seriesIndex = i;
    step.startAngle = current;
    step.endAngle = current;

    double v = normalized[i];
    if (v != 0.0) {
      step.zero = false;
      step.sliceIndex = sliceIndex++;
      if (valuesTotal > 0.0) {
        step.endAngle = current + (v / valuesTotal) * 360.0;
      }
      current = step.endAngle;
    }
    walk.steps.push_back(step);
  }

  walk.sliceCount = sliceIndex;
  return walk;
}

double donutInnerRadius(double radius, double donutWidth) {
  return std::clamp(radius - donutWidth, 0.0, std::max(radius, 0.0));
}

std::vector<SliceDescriptor> buildSlices(const AngleWalk& walk,
                                         const ChartFrame& frame,
                                         const PieChartConfig& config) {
  std::vector<SliceDescriptor> slices;
  slices.reserve(static_cast<std::size_t>(walk.sliceCount));

  const Point center = frame.center;
  const double r = std::max(frame.radius, 0.0);
  const double innerR = donutInnerRadius(r, config.donutWidth);
  const std::vector<double> ramp = colorRamp(walk.sliceCount, config.palette);

  for (const auto& step : walk.steps) {
    if (step.zero) continue;

    SliceDescriptor s;
    s.seriesIndex = step.seriesIndex;
    s.sliceIndex = step.sliceIndex;
    s.startAngle = step.startAngle;
    s.endAngle = step.endAngle;

    s.drawnStartAngle = step.startAngle;
    if (step.sliceIndex != 0) {
      s.drawnStartAngle = std::max(step.startAngle - kSeamOverlapDeg, walk.startAngle);
    }
    s.drawnEndAngle = step.endAngle;
    if (s.drawnEndAngle - s.drawnStartAngle >= kMaxDrawnSpanDeg) {
      s.drawnEndAngle = s.drawnStartAngle + kMaxDrawnSpanDeg;
    }

    s.largeArc = (step.endAngle - step.startAngle) > 180.0 ? 1 : 0;

    Point startPos = polarToCartesian(center, r, s.drawnStartAngle);
    Point endPos = polarToCartesian(center, r, s.drawnEndAngle);

    // Outer rim is traced end -> start (counter-clockwise).
    s.path.moveTo(endPos).arcTo(r, r, s.largeArc, 0, startPos);
    if (config.donut) {
      Point startInner = polarToCartesian(center, innerR, s.drawnStartAngle);
      Point endInner = polarToCartesian(center, innerR, s.drawnEndAngle);
      s.path.lineTo(startInner)
            .arcTo(innerR, innerR, s.largeArc, 1, endInner)
            .close();
    } else {
      s.path.lineTo(center).close();
    }

    s.colorValue = ramp[static_cast<std::size_t>(step.sliceIndex)];
    s.fill = fillForColor(s.colorValue, config.palette);

    slices.push_back(std::move(s));
  }

  return slices;
}

} // namespace pc
