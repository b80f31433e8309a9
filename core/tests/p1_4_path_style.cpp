// P1.4 — SlicePath SVG data, slice color ramp, default value formatting
// Tests:
//   1. SlicePath commands + compact SVG path data
//   2. formatCoord strips trig residue
//   3. colorForIndex / fillForIndex shade ramp
//   4. formatValue shortest round-trip text

#include "pc/pie/SlicePath.hpp"
#include "pc/style/SliceColor.hpp"
#include "pc/text/NumberFormat.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static void requireStr(const std::string& got, const char* expected, const char* msg) {
  if (got != expected) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got \"%s\", expected \"%s\")\n",
                 msg, got.c_str(), expected);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: path commands ---
  {
    pc::SlicePath path;
    path.moveTo({1, 2}).arcTo(3, 3, 1, 0, {4, 5}).lineTo({6, 7}).close();

    requireTrue(path.commands().size() == 4, "4 commands");
    requireTrue(path.commands()[0].op == pc::PathOp::MoveTo, "cmd 0 moveTo");
    requireTrue(path.commands()[1].op == pc::PathOp::ArcTo, "cmd 1 arcTo");
    requireTrue(path.commands()[1].largeArc == 1, "arc large flag");
    requireTrue(path.commands()[1].sweep == 0, "arc sweep flag");
    requireTrue(path.commands()[2].op == pc::PathOp::LineTo, "cmd 2 lineTo");
    requireTrue(path.commands()[3].op == pc::PathOp::Close, "cmd 3 close");
    requireStr(path.toSvgPathData(), "M1,2A3,3,0,1,0,4,5L6,7Z", "svg path data");

    pc::SlicePath empty;
    requireTrue(empty.empty(), "default path empty");
    requireStr(empty.toSvgPathData(), "", "empty path data");
    std::printf("  Test 1 (path commands): PASS\n");
  }

  // --- Test 2: coordinate formatting ---
  {
    requireStr(pc::formatCoord(300.00000000000001), "300", "300 + residue");
    requireStr(pc::formatCoord(1e-14), "0", "tiny positive -> 0");
    requireStr(pc::formatCoord(-1e-12), "0", "tiny negative -> 0");
    requireStr(pc::formatCoord(0.5), "0.5", "0.5");
    requireStr(pc::formatCoord(-42.25), "-42.25", "-42.25");
    std::printf("  Test 2 (coord formatting): PASS\n");
  }

  // --- Test 3: color ramp ---
  {
    requireNear(pc::colorForIndex(0), 255.0, 1e-9, "slice 0 = 255");
    requireNear(pc::colorForIndex(1), 180.0, 1e-9, "slice 1 = 255 - 75");
    requireNear(pc::colorForIndex(2), 142.5, 1e-9, "slice 2 = 180 - 37.5");
    requireNear(pc::colorForIndex(3), 117.5, 1e-9, "slice 3 = 142.5 - 25");
    requireNear(pc::colorForIndex(100), 0.0, 1e-9, "deep slices clamp at 0");

    // Slowing decay: each step smaller than the previous
    double prevStep = 1e9;
    for (int i = 1; i < 10; i++) {
      double step = pc::colorForIndex(i - 1) - pc::colorForIndex(i);
      requireTrue(step > 0.0 && step < prevStep, "monotonically slowing decay");
      prevStep = step;
    }

    requireStr(pc::fillForIndex(0), "rgb(255, 40, 40)", "fill 0");
    requireStr(pc::fillForIndex(2), "rgb(143, 40, 40)", "fill 2 rounds 142.5 up");

    // Whole-chart ramp matches the per-index function exactly
    auto ramp = pc::colorRamp(25);
    requireTrue(ramp.size() == 25, "ramp size");
    for (int i = 0; i < 25; i++) {
      requireTrue(ramp[static_cast<std::size_t>(i)] == pc::colorForIndex(i),
                  "ramp entry == colorForIndex");
    }
    requireTrue(pc::colorRamp(0).empty(), "empty ramp");
    requireStr(pc::fillForColor(ramp[2]), "rgb(143, 40, 40)", "fill from ramp value");

    pc::SlicePalette blue;
    blue.base = 200.0;
    blue.decay = 50.0;
    blue.green = 10.0;
    blue.blue = 250.0;
    requireStr(pc::fillForIndex(1, blue), "rgb(150, 10, 250)", "custom palette");
    std::printf("  Test 3 (color ramp): PASS\n");
  }

  // --- Test 4: value formatting ---
  {
    requireStr(pc::formatValue(1.0), "1", "integral");
    requireStr(pc::formatValue(-5.0), "-5", "negative integral");
    requireStr(pc::formatValue(0.0), "0", "zero");
    requireStr(pc::formatValue(-0.0), "0", "negative zero");
    requireStr(pc::formatValue(2.5), "2.5", "2.5");
    requireStr(pc::formatValue(59.54), "59.54", "59.54");
    requireStr(pc::formatValue(0.1), "0.1", "0.1");
    requireStr(pc::formatValue(1234567.0), "1234567", "large integral");
    requireStr(pc::formatValue(1e15), "1000000000000000", "1e15 without exponent");
    requireStr(pc::formatValue(-2e15), "-2000000000000000", "-2e15 without exponent");
    requireStr(pc::formatValue(9007199254740992.0), "9007199254740992", "2^53 exact");
    requireStr(pc::formatValue(std::numeric_limits<double>::quiet_NaN()), "NaN", "NaN");
    requireStr(pc::formatValue(std::numeric_limits<double>::infinity()), "inf", "inf");
    std::printf("  Test 4 (value formatting): PASS\n");
  }

  std::printf("\nAll path/style tests passed.\n");
  return 0;
}
