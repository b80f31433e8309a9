#include "pc/text/NumberFormat.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace pc {

// 2^53: every integral double up to here prints exactly with %.0f.
constexpr double kMaxExactInteger = 9007199254740992.0;

std::string formatValue(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

  char buf[64];
  if (value == std::floor(value) && std::fabs(value) <= kMaxExactInteger) {
    // Avoid "-0".
    if (value == 0.0) return "0";
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    return buf;
  }

  for (int precision = 1; precision <= 17; precision++) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
    if (std::strtod(buf, nullptr) == value) break;
  }
  return buf;
}

} // namespace pc
