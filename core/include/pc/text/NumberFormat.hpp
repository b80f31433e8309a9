#pragma once
#include <string>

namespace pc {

// Default label text for a raw series value: the shortest decimal form that
// parses back to the same double ("1", "2.5", "59.54").
// Integral values up to 2^53 never use an exponent.
std::string formatValue(double value);

} // namespace pc
