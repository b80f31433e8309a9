#include "pc/pie/PieConfig.hpp"

#include <algorithm>

namespace pc {

bool parseLabelPosition(const std::string& name, LabelPosition& out) {
  if (name == "inside")  { out = LabelPosition::Inside;  return true; }
  if (name == "outside") { out = LabelPosition::Outside; return true; }
  if (name == "center")  { out = LabelPosition::Center;  return true; }
  return false;
}

ChartFrame resolveFrame(const PieChartConfig& config) {
  ChartFrame f;
  if (config.hasFrame) {
    f.center = config.center;
    f.radius = config.radius;
    return f;
  }
  f.center.x = static_cast<double>(config.viewboxWidth) / 2.0;
  f.center.y = static_cast<double>(config.viewboxHeight) / 2.0;
  f.radius = std::min(f.center.x, f.center.y) - kFrameMargin - config.padding;
  return f;
}

} // namespace pc
