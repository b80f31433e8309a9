#include "pc/pie/TotalResolver.hpp"

#include <algorithm>
#include <cmath>

namespace pc {

TotalResolution resolveTotal(double normalizedSum, double rawSum,
                             const TotalOptions& opts) {
  TotalResolution r;

  if (opts.hasShowRatio) {
    double ratio = opts.showRatio;
    if (!(ratio >= kMinShowRatio && ratio <= kMaxShowRatio)) {
      r.ratioClamped = true;
      // NaN falls through both comparisons; treat it as the full circle.
      ratio = std::isnan(ratio) ? kMaxShowRatio
                                : std::clamp(ratio, kMinShowRatio, kMaxShowRatio);
    }
    r.valuesTotal = normalizedSum / ratio;
    return r;
  }

  if (opts.hasTotal) {
    if (rawSum > 0.0 && std::isfinite(rawSum) && std::isfinite(opts.total)) {
      double scaled = normalizedSum / rawSum * opts.total;
      r.valuesTotal = std::max(scaled, normalizedSum);
    } else {
      r.totalIgnored = true;
      r.valuesTotal = normalizedSum;
    }
    return r;
  }

  r.valuesTotal = normalizedSum;
  return r;
}

} // namespace pc
