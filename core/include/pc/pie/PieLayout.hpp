#pragma once
#include "pc/diag/Diagnostics.hpp"
#include "pc/geom/Point.hpp"
#include "pc/pie/LabelPlacer.hpp"
#include "pc/pie/PieConfig.hpp"
#include "pc/pie/SliceBuilder.hpp"

#include <vector>

namespace pc {

// Everything a renderer needs to draw one pie/donut chart.
struct PieLayout {
  bool ok{true};
  PieError err{};

  Point center;
  double radius{0};
  double innerRadius{0};   // donut hole; 0 for solid pies
  double labelRadius{0};
  double valuesTotal{0};  // +inf when the true sum overflows a double

  std::vector<SliceDescriptor> slices;  // non-zero entries only
  std::vector<LabelEntry> labels;       // aligned with the series, or empty
  std::vector<LabelAnchor> anchors;     // always aligned with the series
  std::vector<PieWarning> warnings;
};

// Compute slices and labels for one series. Stateless and deterministic.
// An empty series fails with CONFIG_EMPTY_SERIES and no geometry. Degenerate
// configuration is clamped and reported through warnings (and sink, if set).
PieLayout computePieLayout(const std::vector<double>& series,
                           const PieChartConfig& config,
                           const DiagnosticSink& sink = {});

} // namespace pc
