#pragma once
#include "pc/pie/PieConfig.hpp"
#include "pc/pie/PieLayout.hpp"

#include <string>
#include <vector>

namespace pc {

// A series plus its chart configuration, as stored in a JSON document.
// labelInterpolation and palette are code-only and never serialized.
struct PieSpec {
  std::vector<double> series;
  PieChartConfig config;
};

// Serialize a PieSpec to a JSON string. Optional fields are written only
// when set. Returns false (out untouched) when the spec holds a NaN or
// infinite number, which JSON cannot represent.
bool serializePieSpec(const PieSpec& spec, std::string& out,
                      std::string* error = nullptr);

// Deserialize a JSON document into a PieSpec. Returns false on parse error,
// missing "series", or a known key with the wrong type; error (if non-null)
// receives a message. Unknown keys are ignored.
bool deserializePieSpec(const std::string& json, PieSpec& out,
                        std::string* error = nullptr);

// Export a computed layout for renderers that consume JSON:
// {"ok","center","radius","valuesTotal","slices":[...],"labels":[...],"warnings":[...]}
// Non-finite numbers are written as null. Returns false if writing fails.
bool serializePieLayout(const PieLayout& layout, std::string& out);

} // namespace pc
