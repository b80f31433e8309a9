#include "pc/pie/PieLayout.hpp"
#include "pc/math/Normalize.hpp"
#include "pc/pie/TotalResolver.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace pc {

static void warn(PieLayout& out, const DiagnosticSink& sink,
                 const char* code, const std::string& message) {
  PieWarning w{code, message};
  if (sink) sink(w);
  out.warnings.push_back(std::move(w));
}

static std::string fmt(const char* f, double a, double b = 0.0) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), f, a, b);
  return buf;
}

PieLayout computePieLayout(const std::vector<double>& series,
                           const PieChartConfig& config,
                           const DiagnosticSink& sink) {
  PieLayout out;

  if (series.empty()) {
    out.ok = false;
    out.err.code = "CONFIG_EMPTY_SERIES";
    out.err.message = "Pie chart error: empty series";
    return out;
  }

  ChartFrame frame = resolveFrame(config);
  out.center = frame.center;
  if (!(frame.radius > 0.0)) {
    warn(out, sink, "RADIUS_NON_POSITIVE",
         fmt("radius %g is not positive; slices collapse to the center", frame.radius));
    frame.radius = 0.0;
  }
  out.radius = frame.radius;

  std::size_t clamped = countClampedEntries(series);
  if (clamped > 0) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%zu negative or non-finite entries clamped to 0",
                  clamped);
    warn(out, sink, "SERIES_NEGATIVE_CLAMPED", buf);
  }
  std::vector<double> normalized = normalizeSeries(series);

  // Angles only depend on ratios. Dividing by the largest entry keeps the
  // sums finite for values near DBL_MAX.
  double scale = seriesMax(normalized);
  if (!(scale > 0.0)) scale = 1.0;
  std::vector<double> shares = scaleSeries(normalized, scale);

  TotalOptions opts;
  opts.hasTotal = config.hasTotal;
  opts.total = config.total / scale;
  opts.hasShowRatio = config.hasShowRatio;
  opts.showRatio = config.showRatio;

  TotalResolution total = resolveTotal(seriesSum(shares),
                                       seriesSum(scaleSeries(series, scale)), opts);
  if (total.ratioClamped) {
    warn(out, sink, "RATIO_CLAMPED",
         fmt("showRatio %g clamped to [0.0001, 1]", config.showRatio));
  }
  if (total.totalIgnored) {
    warn(out, sink, "TOTAL_IGNORED",
         fmt("total %g ignored: raw series sum %g is not positive",
             config.total, seriesSum(series)));
  }
  double walkTotal = total.valuesTotal;
  if (!(walkTotal > 0.0)) {
    warn(out, sink, "TOTAL_NON_POSITIVE",
         fmt("values total %g is not positive; no visible slices", walkTotal * scale));
    walkTotal = 0.0;
  } else if (!std::isfinite(walkTotal)) {
    warn(out, sink, "TOTAL_NON_FINITE",
         "values total is not finite; no visible slices");
    walkTotal = 0.0;
  }
  out.valuesTotal = total.valuesTotal * scale;

  if (config.donut) {
    out.innerRadius = donutInnerRadius(frame.radius, config.donutWidth);
    if (frame.radius - config.donutWidth <= 0.0) {
      warn(out, sink, "DONUT_INNER_CLAMPED",
           fmt("donutWidth %g >= radius %g; inner radius clamped to 0",
               config.donutWidth, frame.radius));
    } else if (!(config.donutWidth > 0.0)) {
      warn(out, sink, "DONUT_WIDTH_NON_POSITIVE",
           fmt("donutWidth %g is not positive; ring has no width", config.donutWidth));
    }
  }

  AngleWalk walk = walkAngles(shares, walkTotal, config.startAngle);
  out.slices = buildSlices(walk, frame, config);

  out.labelRadius = labelRadius(config.labelPosition, frame.radius, config.labelOffset);
  out.anchors = placeLabelAnchors(walk, frame.center, out.labelRadius);
  out.labels = resolveLabelTexts(out.anchors, series, config);

  return out;
}

} // namespace pc
