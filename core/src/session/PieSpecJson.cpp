#include "pc/session/PieSpecJson.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cmath>
#include <cstdint>
#include <utility>

namespace pc {

static bool fail(std::string* error, const std::string& msg) {
  if (error) *error = msg;
  return false;
}

bool serializePieSpec(const PieSpec& spec, std::string& out, std::string* error) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();
  const PieChartConfig& c = spec.config;

  rapidjson::Value series(rapidjson::kArrayType);
  for (double v : spec.series) series.PushBack(v, alloc);
  doc.AddMember("series", series, alloc);

  if (c.hasLabels) {
    rapidjson::Value labels(rapidjson::kArrayType);
    for (const auto& s : c.labels)
      labels.PushBack(rapidjson::Value(s.c_str(), alloc), alloc);
    doc.AddMember("labels", labels, alloc);
  }

  doc.AddMember("viewboxWidth", c.viewboxWidth, alloc);
  doc.AddMember("viewboxHeight", c.viewboxHeight, alloc);
  doc.AddMember("padding", c.padding, alloc);

  if (c.hasFrame) {
    rapidjson::Value center(rapidjson::kObjectType);
    center.AddMember("x", c.center.x, alloc);
    center.AddMember("y", c.center.y, alloc);
    doc.AddMember("center", center, alloc);
    doc.AddMember("radius", c.radius, alloc);
  }

  doc.AddMember("startAngle", c.startAngle, alloc);
  doc.AddMember("donut", c.donut, alloc);
  doc.AddMember("donutWidth", c.donutWidth, alloc);
  doc.AddMember("showLabels", c.showLabels, alloc);
  doc.AddMember("labelPosition",
                rapidjson::Value(toString(c.labelPosition), alloc), alloc);
  doc.AddMember("labelOffset", c.labelOffset, alloc);

  if (c.hasTotal) doc.AddMember("total", c.total, alloc);
  if (c.hasShowRatio) doc.AddMember("showRatio", c.showRatio, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  // The writer stops at NaN/inf and leaves a truncated document.
  if (!doc.Accept(writer))
    return fail(error, "spec contains a non-finite number");
  out = sb.GetString();
  return true;
}

// Reads an optional number; false only when present with the wrong type.
static bool readNumber(const rapidjson::Value& obj, const char* key,
                       double& out, bool* present, std::string* error) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber())
    return fail(error, std::string("'") + key + "' must be a number");
  out = it->value.GetDouble();
  if (present) *present = true;
  return true;
}

static bool readInt(const rapidjson::Value& obj, const char* key,
                    int& out, std::string* error) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsInt())
    return fail(error, std::string("'") + key + "' must be an integer");
  out = it->value.GetInt();
  return true;
}

static bool readBool(const rapidjson::Value& obj, const char* key,
                     bool& out, std::string* error) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool())
    return fail(error, std::string("'") + key + "' must be a boolean");
  out = it->value.GetBool();
  return true;
}

bool deserializePieSpec(const std::string& json, PieSpec& out,
                        std::string* error) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return fail(error, "invalid JSON");
  if (!doc.IsObject()) return fail(error, "document must be an object");

  PieSpec spec;
  PieChartConfig& c = spec.config;

  // Series (required; an empty array is accepted and rejected later by layout)
  if (!doc.HasMember("series") || !doc["series"].IsArray())
    return fail(error, "'series' must be an array of numbers");
  for (const auto& v : doc["series"].GetArray()) {
    if (!v.IsNumber()) return fail(error, "'series' must be an array of numbers");
    spec.series.push_back(v.GetDouble());
  }

  // Labels
  if (doc.HasMember("labels")) {
    const auto& labels = doc["labels"];
    if (!labels.IsArray()) return fail(error, "'labels' must be an array of strings");
    for (const auto& v : labels.GetArray()) {
      if (!v.IsString()) return fail(error, "'labels' must be an array of strings");
      c.labels.push_back(v.GetString());
    }
    c.hasLabels = true;
  }

  // View box
  if (!readInt(doc, "viewboxWidth", c.viewboxWidth, error)) return false;
  if (!readInt(doc, "viewboxHeight", c.viewboxHeight, error)) return false;
  if (!readNumber(doc, "padding", c.padding, nullptr, error)) return false;

  // Explicit frame: needs both center and radius
  if (doc.HasMember("center") || doc.HasMember("radius")) {
    if (!doc.HasMember("center") || !doc.HasMember("radius"))
      return fail(error, "'center' and 'radius' must be given together");
    const auto& center = doc["center"];
    if (!center.IsObject() ||
        !center.HasMember("x") || !center["x"].IsNumber() ||
        !center.HasMember("y") || !center["y"].IsNumber())
      return fail(error, "'center' must be {\"x\":number,\"y\":number}");
    c.center.x = center["x"].GetDouble();
    c.center.y = center["y"].GetDouble();
    if (!readNumber(doc, "radius", c.radius, nullptr, error)) return false;
    c.hasFrame = true;
  }

  if (!readNumber(doc, "startAngle", c.startAngle, nullptr, error)) return false;
  if (!readBool(doc, "donut", c.donut, error)) return false;
  if (!readNumber(doc, "donutWidth", c.donutWidth, nullptr, error)) return false;
  if (!readBool(doc, "showLabels", c.showLabels, error)) return false;
  if (!readNumber(doc, "labelOffset", c.labelOffset, nullptr, error)) return false;

  if (doc.HasMember("labelPosition")) {
    const auto& lp = doc["labelPosition"];
    if (!lp.IsString() || !parseLabelPosition(lp.GetString(), c.labelPosition))
      return fail(error, "'labelPosition' must be \"inside\", \"outside\" or \"center\"");
  }

  if (!readNumber(doc, "total", c.total, &c.hasTotal, error)) return false;
  if (!readNumber(doc, "showRatio", c.showRatio, &c.hasShowRatio, error)) return false;

  out = std::move(spec);
  return true;
}

// Non-finite numbers (e.g. an overflowed valuesTotal) are written as null.
static rapidjson::Value jsonNumber(double v) {
  rapidjson::Value out;
  if (std::isfinite(v)) out.SetDouble(v);
  return out;
}

bool serializePieLayout(const PieLayout& layout, std::string& out) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("ok", layout.ok, alloc);
  if (!layout.ok) {
    rapidjson::Value err(rapidjson::kObjectType);
    err.AddMember("code", rapidjson::Value(layout.err.code.c_str(), alloc), alloc);
    err.AddMember("message", rapidjson::Value(layout.err.message.c_str(), alloc), alloc);
    doc.AddMember("error", err, alloc);
  }

  rapidjson::Value center(rapidjson::kObjectType);
  center.AddMember("x", jsonNumber(layout.center.x), alloc);
  center.AddMember("y", jsonNumber(layout.center.y), alloc);
  doc.AddMember("center", center, alloc);
  doc.AddMember("radius", jsonNumber(layout.radius), alloc);
  doc.AddMember("innerRadius", jsonNumber(layout.innerRadius), alloc);
  doc.AddMember("valuesTotal", jsonNumber(layout.valuesTotal), alloc);

  rapidjson::Value slices(rapidjson::kArrayType);
  for (const auto& s : layout.slices) {
    rapidjson::Value o(rapidjson::kObjectType);
    o.AddMember("seriesIndex", static_cast<std::uint64_t>(s.seriesIndex), alloc);
    o.AddMember("sliceIndex", s.sliceIndex, alloc);
    o.AddMember("startAngle", jsonNumber(s.startAngle), alloc);
    o.AddMember("endAngle", jsonNumber(s.endAngle), alloc);
    o.AddMember("drawnStartAngle", jsonNumber(s.drawnStartAngle), alloc);
    o.AddMember("drawnEndAngle", jsonNumber(s.drawnEndAngle), alloc);
    o.AddMember("largeArc", s.largeArc, alloc);
    o.AddMember("path", rapidjson::Value(s.path.toSvgPathData().c_str(), alloc), alloc);
    o.AddMember("fill", rapidjson::Value(s.fill.c_str(), alloc), alloc);
    slices.PushBack(o, alloc);
  }
  doc.AddMember("slices", slices, alloc);

  rapidjson::Value labels(rapidjson::kArrayType);
  for (const auto& l : layout.labels) {
    rapidjson::Value o(rapidjson::kObjectType);
    o.AddMember("suppressed", l.anchor.suppressed, alloc);
    if (!l.anchor.suppressed) {
      o.AddMember("x", jsonNumber(l.anchor.point.x), alloc);
      o.AddMember("y", jsonNumber(l.anchor.point.y), alloc);
    }
    if (l.hasText)
      o.AddMember("text", rapidjson::Value(l.text.c_str(), alloc), alloc);
    labels.PushBack(o, alloc);
  }
  doc.AddMember("labels", labels, alloc);

  rapidjson::Value warnings(rapidjson::kArrayType);
  for (const auto& w : layout.warnings) {
    rapidjson::Value o(rapidjson::kObjectType);
    o.AddMember("code", rapidjson::Value(w.code.c_str(), alloc), alloc);
    o.AddMember("message", rapidjson::Value(w.message.c_str(), alloc), alloc);
    warnings.PushBack(o, alloc);
  }
  doc.AddMember("warnings", warnings, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  if (!doc.Accept(writer)) return false;
  out = sb.GetString();
  return true;
}

} // namespace pc
