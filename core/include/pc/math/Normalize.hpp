#pragma once
#include <cstddef>
#include <vector>

namespace pc {

// Map a raw series onto non-negative magnitudes usable as angular shares.
// Negative and non-finite entries are clamped to 0; length and order are kept.
std::vector<double> normalizeSeries(const std::vector<double>& series);

// Number of entries normalizeSeries() would clamp (negative or non-finite).
std::size_t countClampedEntries(const std::vector<double>& series);

double seriesSum(const std::vector<double>& series);

// Largest entry, or 0 for an empty / all-non-positive series.
double seriesMax(const std::vector<double>& series);

// Every entry divided by divisor (divisor must be > 0).
std::vector<double> scaleSeries(const std::vector<double>& series, double divisor);

} // namespace pc
