#pragma once
#include "pc/geom/Point.hpp"
#include "pc/style/SliceColor.hpp"

#include <functional>
#include <string>
#include <vector>

namespace pc {

// Hint for automatic label placement.
enum class LabelPosition : unsigned char {
  Inside,   // halfway between center and rim
  Outside,  // on the rim
  Center    // at the center; move it with labelOffset
};

inline const char* toString(LabelPosition p) {
  switch (p) {
    case LabelPosition::Inside: return "inside";
    case LabelPosition::Outside: return "outside";
    case LabelPosition::Center: return "center";
    default: return "unknown";
  }
}

// Returns false for unknown names; out is left untouched.
bool parseLabelPosition(const std::string& name, LabelPosition& out);

// Formats a raw series value into label text.
using LabelFormatter = std::function<std::string(double)>;

// Immutable snapshot for one computePieLayout() call.
struct PieChartConfig {
  // View box; center and radius derive from it unless hasFrame is set.
  int viewboxWidth{600};
  int viewboxHeight{400};
  double padding{0};

  bool hasFrame{false};
  Point center;
  double radius{0};

  double startAngle{0};   // degrees, 0 = 12 o'clock, clockwise

  bool donut{false};
  double donutWidth{40.0};

  bool showLabels{true};
  LabelPosition labelPosition{LabelPosition::Inside};
  double labelOffset{0};
  LabelFormatter labelInterpolation;  // empty: formatValue()

  bool hasLabels{false};
  std::vector<std::string> labels;    // aligned with the series

  bool hasTotal{false};
  double total{0};

  bool hasShowRatio{false};
  double showRatio{1.0};

  SlicePalette palette;
};

struct ChartFrame {
  Point center;
  double radius{0};
};

// Margin between the view box edge and the rim, before padding.
constexpr double kFrameMargin = 30.0;

// center = view box middle, radius = min(cx, cy) - 30 - padding,
// or the explicit frame when config.hasFrame.
ChartFrame resolveFrame(const PieChartConfig& config);

} // namespace pc
