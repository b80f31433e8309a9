#pragma once
#include <functional>
#include <string>

namespace pc {

struct PieError {
  std::string code;     // e.g. "CONFIG_EMPTY_SERIES"
  std::string message;  // human text
};

// Non-fatal: the layout was computed after clamping/guarding the input.
struct PieWarning {
  std::string code;     // e.g. "DONUT_INNER_CLAMPED"
  std::string message;
};

using DiagnosticSink = std::function<void(const PieWarning&)>;

// Sink that logs each warning to stderr.
DiagnosticSink stderrSink();

} // namespace pc
