#pragma once

namespace pc {

constexpr double kMinShowRatio = 0.0001;
constexpr double kMaxShowRatio = 1.0;

struct TotalOptions {
  bool hasTotal{false};
  double total{0};
  bool hasShowRatio{false};
  double showRatio{1.0};   // fraction of the circle the data occupies (gauge)
};

struct TotalResolution {
  double valuesTotal{0};   // value that maps to a full 360 degrees
  bool ratioClamped{false};
  bool totalIgnored{false};
};

// Resolve the "whole circle" value. Precedence: showRatio, total, natural sum.
TotalResolution resolveTotal(double normalizedSum, double rawSum,
                             const TotalOptions& opts);

} // namespace pc
