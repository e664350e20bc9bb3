#include "oc/session/ChartConfig.hpp"
#include "oc/study/BollingerStudy.hpp"
#include "oc/study/CandleStudy.hpp"
#include "oc/study/EmaStudy.hpp"
#include "oc/study/LastPriceLineStudy.hpp"
#include "oc/study/RsiStudy.hpp"
#include "oc/study/SmaStudy.hpp"
#include "oc/study/VolumeStudy.hpp"
#include "oc/style/Theme.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>

namespace oc {

static bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsNumber()) return false;
  out = obj[key].GetDouble();
  return true;
}

static bool readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsInt()) return false;
  out = obj[key].GetInt();
  return true;
}

static bool parseStudy(const rapidjson::Value& v, StudySpec& out, std::string& err) {
  if (!v.IsObject()) {
    err = "study entry must be an object";
    return false;
  }
  if (!v.HasMember("type") || !v["type"].IsString()) {
    err = "study entry needs a string 'type'";
    return false;
  }
  out.type = v["type"].GetString();
  if (v.HasMember("pane")) {
    if (!v["pane"].IsString()) {
      err = "study 'pane' must be a string";
      return false;
    }
    out.pane = v["pane"].GetString();
  }
  if (!readInt(v, "period", out.period) || out.period < 0) {
    err = "study 'period' must be a non-negative integer";
    return false;
  }
  if (!readNumber(v, "multiplier", out.multiplier) || !(out.multiplier > 0.0)) {
    err = "study 'multiplier' must be a positive number";
    return false;
  }
  if (!readNumber(v, "heightPercent", out.heightPercent) ||
      !(out.heightPercent > 0.0 && out.heightPercent < 1.0)) {
    err = "study 'heightPercent' must be in (0, 1)";
    return false;
  }
  return true;
}

bool parseChartConfig(const std::string& json, ChartConfig& out, std::string& err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    err = "config is not a JSON object";
    return false;
  }

  ChartConfig cfg = out;

  if (!readNumber(doc, "width", cfg.width) || !readNumber(doc, "height", cfg.height) ||
      !(cfg.width > 0.0) || !(cfg.height > 0.0)) {
    err = "'width' and 'height' must be positive numbers";
    return false;
  }

  if (doc.HasMember("padding")) {
    const auto& p = doc["padding"];
    if (!p.IsObject() || !readNumber(p, "top", cfg.padding.top) ||
        !readNumber(p, "right", cfg.padding.right) ||
        !readNumber(p, "bottom", cfg.padding.bottom) ||
        !readNumber(p, "left", cfg.padding.left)) {
      err = "'padding' must be an object of numbers";
      return false;
    }
  }

  if (doc.HasMember("theme")) {
    Theme unused;
    if (!doc["theme"].IsString() || !themeByName(doc["theme"].GetString(), unused)) {
      err = "'theme' must be \"dark\" or \"light\"";
      return false;
    }
    cfg.theme = doc["theme"].GetString();
  }

  if (!readInt(doc, "visibleCandles", cfg.visibleCandles) || cfg.visibleCandles < 1) {
    err = "'visibleCandles' must be a positive integer";
    return false;
  }
  if (!readInt(doc, "loadMoreThreshold", cfg.loadMoreThreshold) || cfg.loadMoreThreshold < 0) {
    err = "'loadMoreThreshold' must be a non-negative integer";
    return false;
  }

  if (doc.HasMember("zoom")) {
    const auto& z = doc["zoom"];
    if (!z.IsObject() || !readNumber(z, "minVisibleCandles", cfg.zoom.minVisibleCandles) ||
        !readNumber(z, "maxVisibleCandles", cfg.zoom.maxVisibleCandles) ||
        !readNumber(z, "zoomFactor", cfg.zoom.zoomFactor)) {
      err = "'zoom' must be an object of numbers";
      return false;
    }
    if (!(cfg.zoom.minVisibleCandles > 0.0) ||
        cfg.zoom.maxVisibleCandles < cfg.zoom.minVisibleCandles ||
        !(cfg.zoom.zoomFactor > 1.0)) {
      err = "'zoom' limits out of range";
      return false;
    }
  }

  if (doc.HasMember("tzOffsetMs")) {
    if (!doc["tzOffsetMs"].IsInt64()) {
      err = "'tzOffsetMs' must be an integer";
      return false;
    }
    cfg.tzOffsetMs = doc["tzOffsetMs"].GetInt64();
  }

  if (doc.HasMember("studies")) {
    if (!doc["studies"].IsArray()) {
      err = "'studies' must be an array";
      return false;
    }
    cfg.studies.clear();
    for (const auto& v : doc["studies"].GetArray()) {
      StudySpec spec;
      if (!parseStudy(v, spec, err)) return false;
      cfg.studies.push_back(spec);
    }
  }

  out = cfg;
  return true;
}

std::string serializeChartConfig(const ChartConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("width", config.width, alloc);
  doc.AddMember("height", config.height, alloc);

  rapidjson::Value pad(rapidjson::kObjectType);
  pad.AddMember("top", config.padding.top, alloc);
  pad.AddMember("right", config.padding.right, alloc);
  pad.AddMember("bottom", config.padding.bottom, alloc);
  pad.AddMember("left", config.padding.left, alloc);
  doc.AddMember("padding", pad, alloc);

  doc.AddMember("theme", rapidjson::Value(config.theme.c_str(), alloc), alloc);
  doc.AddMember("visibleCandles", config.visibleCandles, alloc);
  doc.AddMember("loadMoreThreshold", config.loadMoreThreshold, alloc);

  rapidjson::Value zoom(rapidjson::kObjectType);
  zoom.AddMember("minVisibleCandles", config.zoom.minVisibleCandles, alloc);
  zoom.AddMember("maxVisibleCandles", config.zoom.maxVisibleCandles, alloc);
  zoom.AddMember("zoomFactor", config.zoom.zoomFactor, alloc);
  doc.AddMember("zoom", zoom, alloc);

  doc.AddMember("tzOffsetMs", static_cast<std::int64_t>(config.tzOffsetMs), alloc);

  rapidjson::Value studies(rapidjson::kArrayType);
  for (const auto& s : config.studies) {
    rapidjson::Value v(rapidjson::kObjectType);
    v.AddMember("type", rapidjson::Value(s.type.c_str(), alloc), alloc);
    v.AddMember("pane", rapidjson::Value(s.pane.c_str(), alloc), alloc);
    if (s.period > 0) v.AddMember("period", s.period, alloc);
    if (s.type == "bollinger") v.AddMember("multiplier", s.multiplier, alloc);
    if (s.pane != "main") v.AddMember("heightPercent", s.heightPercent, alloc);
    studies.PushBack(v, alloc);
  }
  doc.AddMember("studies", studies, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

std::unique_ptr<Study> makeStudy(const StudySpec& spec) {
  const bool hasPeriod = spec.period > 0;
  if (spec.type == "candles") return std::make_unique<CandleStudy>();
  if (spec.type == "volume") return std::make_unique<VolumeStudy>();
  if (spec.type == "lastPrice") return std::make_unique<LastPriceLineStudy>();
  if (spec.type == "sma")
    return hasPeriod ? std::make_unique<SmaStudy>(spec.period) : std::make_unique<SmaStudy>();
  if (spec.type == "ema")
    return hasPeriod ? std::make_unique<EmaStudy>(spec.period) : std::make_unique<EmaStudy>();
  if (spec.type == "rsi")
    return hasPeriod ? std::make_unique<RsiStudy>(spec.period) : std::make_unique<RsiStudy>();
  if (spec.type == "bollinger")
    return std::make_unique<BollingerStudy>(hasPeriod ? spec.period : 20, spec.multiplier);
  throw std::invalid_argument("makeStudy: unknown study type '" + spec.type + "'");
}

} // namespace oc
