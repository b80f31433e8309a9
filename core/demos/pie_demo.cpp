// Pie chart demo
// Loads a pie spec (JSON file, or a built-in world-population sample),
// computes the layout, writes an SVG document and prints the layout JSON.
//
// Usage: pie_demo [spec.json] [out.svg]

#include "pc/diag/Diagnostics.hpp"
#include "pc/pie/PieLayout.hpp"
#include "pc/session/PieSpecJson.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static pc::PieSpec sampleSpec() {
  pc::PieSpec spec;
  spec.series = {59.54, 17.2, 9.59, 7.6, 5.53, 0.55};
  spec.config.hasLabels = true;
  spec.config.labels = {"Asia", "Africa", "Europe", "N. America", "S. America", "Oceania"};
  spec.config.startAngle = -60.0;
  spec.config.labelPosition = pc::LabelPosition::Outside;
  spec.config.labelOffset = 35.0;
  spec.config.padding = 20.0;
  return spec;
}

static std::string escapeXml(const std::string& s) {
  std::string out;
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c;
    }
  }
  return out;
}

static bool writeSvg(const char* path, const pc::PieSpec& spec,
                     const pc::PieLayout& layout) {
  std::FILE* f = std::fopen(path, "wb");
  if (!f) return false;

  std::fprintf(f,
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 %d %d\" "
    "preserveAspectRatio=\"xMidYMid meet\">\n",
    spec.config.viewboxWidth, spec.config.viewboxHeight);

  std::fprintf(f, "  <g>\n");
  for (const auto& s : layout.slices) {
    std::fprintf(f, "    <path d=\"%s\" fill=\"%s\"/>\n",
                 s.path.toSvgPathData().c_str(), s.fill.c_str());
  }
  std::fprintf(f, "  </g>\n");

  std::fprintf(f, "  <g>\n");
  for (const auto& l : layout.labels) {
    if (l.anchor.suppressed || !l.hasText) continue;
    std::fprintf(f,
      "    <text x=\"%.3f\" y=\"%.3f\" text-anchor=\"middle\" "
      "alignment-baseline=\"middle\">%s</text>\n",
      l.anchor.point.x, l.anchor.point.y, escapeXml(l.text).c_str());
  }
  std::fprintf(f, "  </g>\n</svg>\n");

  return std::fclose(f) == 0;
}

int main(int argc, char** argv) {
  pc::PieSpec spec = sampleSpec();

  if (argc > 1) {
    std::string json;
    if (!readFile(argv[1], json)) {
      std::fprintf(stderr, "pie_demo: cannot read %s\n", argv[1]);
      return 1;
    }
    std::string error;
    if (!pc::deserializePieSpec(json, spec, &error)) {
      std::fprintf(stderr, "pie_demo: %s: %s\n", argv[1], error.c_str());
      return 1;
    }
  }
  const char* outPath = argc > 2 ? argv[2] : "pie_demo.svg";

  pc::PieLayout layout = pc::computePieLayout(spec.series, spec.config, pc::stderrSink());
  if (!layout.ok) {
    std::fprintf(stderr, "pie_demo: %s (%s)\n",
                 layout.err.message.c_str(), layout.err.code.c_str());
    return 1;
  }

  if (!writeSvg(outPath, spec, layout)) {
    std::fprintf(stderr, "pie_demo: failed to write %s\n", outPath);
    return 1;
  }

  std::string layoutJson;
  if (!pc::serializePieLayout(layout, layoutJson)) {
    std::fprintf(stderr, "pie_demo: failed to serialize layout\n");
    return 1;
  }
  std::printf("%s\n", layoutJson.c_str());
  std::fprintf(stderr, "pie_demo: %zu slices written to %s\n",
               layout.slices.size(), outPath);
  return 0;
}
