#include "pc/math/Normalize.hpp"
#include <cmath>

namespace pc {

static bool clampsToZero(double v) {
  return !std::isfinite(v) || v < 0.0;
}

std::vector<double> normalizeSeries(const std::vector<double>& series) {
  std::vector<double> out;
  out.reserve(series.size());
  for (double v : series) {
    out.push_back(clampsToZero(v) ? 0.0 : v);
  }
  return out;
}

std::size_t countClampedEntries(const std::vector<double>& series) {
  std::size_t n = 0;
  for (double v : series) {
    if (clampsToZero(v)) n++;
  }
  return n;
}

double seriesSum(const std::vector<double>& series) {
  double sum = 0.0;
  for (double v : series) sum += v;
  return sum;
}

double seriesMax(const std::vector<double>& series) {
  double m = 0.0;
  for (double v : series) {
    if (v > m) m = v;
  }
  return m;
}

std::vector<double> scaleSeries(const std::vector<double>& series, double divisor) {
  std::vector<double> out;
  out.reserve(series.size());
  for (double v : series) out.push_back(v / divisor);
  return out;
}

} // namespace pc
