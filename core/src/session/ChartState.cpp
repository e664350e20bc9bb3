#include "oc/session/ChartState.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace oc {

std::string serializeChartState(const ChartState& state) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(state.version.c_str(), alloc), alloc);

  rapidjson::Value view(rapidjson::kObjectType);
  view.AddMember("startIndex", state.view.startIndex, alloc);
  view.AddMember("endIndex", state.view.endIndex, alloc);
  doc.AddMember("view", view, alloc);

  doc.AddMember("zoomLevel", state.zoomLevel, alloc);
  doc.AddMember("theme",
                rapidjson::Value(state.themeName.c_str(), alloc), alloc);

  if (!state.symbol.empty())
    doc.AddMember("symbol", rapidjson::Value(state.symbol.c_str(), alloc), alloc);
  if (!state.timeframe.empty())
    doc.AddMember("timeframe", rapidjson::Value(state.timeframe.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeChartState(const std::string& json, ChartState& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();

  if (doc.HasMember("view") && doc["view"].IsObject()) {
    const auto& v = doc["view"];
    if (v.HasMember("startIndex") && v["startIndex"].IsNumber())
      out.view.startIndex = v["startIndex"].GetDouble();
    if (v.HasMember("endIndex") && v["endIndex"].IsNumber())
      out.view.endIndex = v["endIndex"].GetDouble();
  }

  if (doc.HasMember("zoomLevel") && doc["zoomLevel"].IsNumber())
    out.zoomLevel = doc["zoomLevel"].GetDouble();

  if (doc.HasMember("theme") && doc["theme"].IsString())
    out.themeName = doc["theme"].GetString();

  if (doc.HasMember("symbol") && doc["symbol"].IsString())
    out.symbol = doc["symbol"].GetString();

  if (doc.HasMember("timeframe") && doc["timeframe"].IsString())
    out.timeframe = doc["timeframe"].GetString();

  return true;
}

} // namespace oc
