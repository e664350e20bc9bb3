#include "oc/render/CommandCompositor.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>

namespace oc {

using rapidjson::Value;

namespace {

bool finite(double v) { return std::isfinite(v); }

Value colorValue(const Color& c, rapidjson::Document::AllocatorType& alloc) {
  Value arr(rapidjson::kArrayType);
  for (float f : c) arr.PushBack(static_cast<double>(f), alloc);
  return arr;
}

Value boundsValue(const Bounds& b, rapidjson::Document::AllocatorType& alloc) {
  Value arr(rapidjson::kArrayType);
  arr.PushBack(b.x, alloc).PushBack(b.y, alloc).PushBack(b.width, alloc).PushBack(b.height, alloc);
  return arr;
}

const char* alignName(TextAlign a) {
  switch (a) {
    case TextAlign::Left:   return "left";
    case TextAlign::Center: return "center";
    case TextAlign::Right:  return "right";
  }
  return "left";
}

const char* baselineName(TextBaseline b) {
  switch (b) {
    case TextBaseline::Top:    return "top";
    case TextBaseline::Middle: return "middle";
    case TextBaseline::Bottom: return "bottom";
  }
  return "middle";
}

Value textValue(const TextShape& t, rapidjson::Document::AllocatorType& alloc) {
  Value o(rapidjson::kObjectType);
  o.AddMember("x", t.position.x, alloc);
  o.AddMember("y", t.position.y, alloc);
  o.AddMember("text", Value(t.text.c_str(), alloc), alloc);
  o.AddMember("color", colorValue(t.color, alloc), alloc);
  o.AddMember("fontSize", static_cast<double>(t.fontSize), alloc);
  o.AddMember("align", Value(alignName(t.align), alloc), alloc);
  o.AddMember("baseline", Value(baselineName(t.baseline), alloc), alloc);
  return o;
}

void writeCandles(const CandleBatch& b, Value& cmd, rapidjson::Document::AllocatorType& alloc) {
  cmd.AddMember("upColor", colorValue(b.upColor, alloc), alloc);
  cmd.AddMember("downColor", colorValue(b.downColor, alloc), alloc);
  Value pts(rapidjson::kArrayType);
  for (const auto& p : b.points()) {
    if (!finite(p.x) || !finite(p.body.y) || !finite(p.body.height)) continue;
    Value o(rapidjson::kObjectType);
    o.AddMember("x", p.x, alloc);
    Value uw(rapidjson::kArrayType);
    uw.PushBack(p.upperWick.y1, alloc).PushBack(p.upperWick.y2, alloc);
    o.AddMember("upperWick", uw, alloc);
    Value lw(rapidjson::kArrayType);
    lw.PushBack(p.lowerWick.y1, alloc).PushBack(p.lowerWick.y2, alloc);
    o.AddMember("lowerWick", lw, alloc);
    Value body(rapidjson::kArrayType);
    body.PushBack(p.body.y, alloc).PushBack(p.body.height, alloc).PushBack(p.body.width, alloc);
    o.AddMember("body", body, alloc);
    o.AddMember("up", p.isPositive, alloc);
    pts.PushBack(o, alloc);
  }
  cmd.AddMember("points", pts, alloc);
}

void writeBars(const BarBatch& b, Value& cmd, rapidjson::Document::AllocatorType& alloc) {
  cmd.AddMember("upColor", colorValue(b.upColor, alloc), alloc);
  cmd.AddMember("downColor", colorValue(b.downColor, alloc), alloc);
  Value pts(rapidjson::kArrayType);
  for (const auto& p : b.points()) {
    if (!finite(p.x) || !finite(p.y) || !finite(p.height)) continue;
    Value o(rapidjson::kArrayType);
    o.PushBack(p.x, alloc).PushBack(p.y, alloc).PushBack(p.width, alloc).PushBack(p.height, alloc);
    o.PushBack(p.isPositive, alloc);
    pts.PushBack(o, alloc);
  }
  cmd.AddMember("points", pts, alloc);
}

void writePolyline(const PolylineBatch& b, Value& cmd,
                   rapidjson::Document::AllocatorType& alloc) {
  cmd.AddMember("color", colorValue(b.color, alloc), alloc);
  cmd.AddMember("lineWidth", static_cast<double>(b.lineWidth), alloc);
  if (!b.dash.empty()) {
    Value dash(rapidjson::kArrayType);
    for (float d : b.dash) dash.PushBack(static_cast<double>(d), alloc);
    cmd.AddMember("dash", dash, alloc);
  }
  Value pts(rapidjson::kArrayType);
  for (const auto& p : b.points()) {
    if (!finite(p.x) || !finite(p.y)) continue;
    pts.PushBack(p.x, alloc).PushBack(p.y, alloc);
  }
  cmd.AddMember("points", pts, alloc);  // flat x,y pairs
}

void writeBand(const BandFillBatch& b, Value& cmd, rapidjson::Document::AllocatorType& alloc) {
  cmd.AddMember("fillColor", colorValue(b.fillColor, alloc), alloc);
  cmd.AddMember("fillOpacity", static_cast<double>(b.fillOpacity), alloc);
  cmd.AddMember("borderColor", colorValue(b.borderColor, alloc), alloc);
  cmd.AddMember("borderWidth", static_cast<double>(b.borderWidth), alloc);
  cmd.AddMember("showBorders", b.showBorders, alloc);
  Value pts(rapidjson::kArrayType);
  for (const auto& p : b.points()) {
    if (!finite(p.upper.x) || !finite(p.upper.y) || !finite(p.lower.y) || !finite(p.middle.y))
      continue;
    Value o(rapidjson::kArrayType);
    o.PushBack(p.upper.x, alloc)
        .PushBack(p.upper.y, alloc)
        .PushBack(p.middle.y, alloc)
        .PushBack(p.lower.y, alloc);
    pts.PushBack(o, alloc);
  }
  cmd.AddMember("points", pts, alloc);  // [x, upperY, middleY, lowerY]
}

} // namespace

CommandCompositor::CommandCompositor() { commands_.SetArray(); }

Value& CommandCompositor::push(const char* op) {
  auto& alloc = commands_.GetAllocator();
  Value cmd(rapidjson::kObjectType);
  cmd.AddMember("op", Value(op, alloc), alloc);
  commands_.PushBack(cmd, alloc);
  return commands_[commands_.Size() - 1];
}

void CommandCompositor::setupHighDPI(double width, double height) {
  width_ = width;
  height_ = height;
}

void CommandCompositor::clear() {
  commands_.SetArray();
  commands_.GetAllocator().Clear();
  ++frame_;
  push("clear");
}

void CommandCompositor::render(const ShapeBatch& batch) {
  auto& alloc = commands_.GetAllocator();
  Value& cmd = push("batch");
  cmd.AddMember("kind", Value(batchKindName(batch.kind()), alloc), alloc);
  switch (batch.kind()) {
    case BatchKind::Candle:
      writeCandles(static_cast<const CandleBatch&>(batch), cmd, alloc);
      break;
    case BatchKind::Bar:
      writeBars(static_cast<const BarBatch&>(batch), cmd, alloc);
      break;
    case BatchKind::Polyline:
      writePolyline(static_cast<const PolylineBatch&>(batch), cmd, alloc);
      break;
    case BatchKind::BandFill:
      writeBand(static_cast<const BandFillBatch&>(batch), cmd, alloc);
      break;
  }
}

void CommandCompositor::renderShapes(const ShapeList& shapes) {
  auto& alloc = commands_.GetAllocator();
  Value& cmd = push("shapes");

  Value lines(rapidjson::kArrayType);
  for (const auto& l : shapes.lines) {
    if (!finite(l.start.x) || !finite(l.start.y) || !finite(l.end.x) || !finite(l.end.y))
      continue;
    Value o(rapidjson::kObjectType);
    Value seg(rapidjson::kArrayType);
    seg.PushBack(l.start.x, alloc).PushBack(l.start.y, alloc);
    seg.PushBack(l.end.x, alloc).PushBack(l.end.y, alloc);
    o.AddMember("seg", seg, alloc);
    o.AddMember("color", colorValue(l.color, alloc), alloc);
    o.AddMember("width", static_cast<double>(l.lineWidth), alloc);
    if (!l.dash.empty()) {
      Value dash(rapidjson::kArrayType);
      for (float d : l.dash) dash.PushBack(static_cast<double>(d), alloc);
      o.AddMember("dash", dash, alloc);
    }
    lines.PushBack(o, alloc);
  }
  cmd.AddMember("lines", lines, alloc);

  Value texts(rapidjson::kArrayType);
  for (const auto& t : shapes.texts) {
    if (!finite(t.position.x) || !finite(t.position.y)) continue;
    texts.PushBack(textValue(t, alloc), alloc);
  }
  cmd.AddMember("texts", texts, alloc);

  Value boxes(rapidjson::kArrayType);
  for (const auto& b : shapes.boxedTexts) {
    if (!finite(b.label.position.x) || !finite(b.label.position.y)) continue;
    Value o = textValue(b.label, alloc);
    o.AddMember("background", colorValue(b.background, alloc), alloc);
    o.AddMember("padding", static_cast<double>(b.padding), alloc);
    boxes.PushBack(o, alloc);
  }
  cmd.AddMember("boxedTexts", boxes, alloc);
}

void CommandCompositor::setClipRegion(const Bounds& bounds) {
  auto& alloc = commands_.GetAllocator();
  push("clip").AddMember("bounds", boundsValue(bounds, alloc), alloc);
}

void CommandCompositor::clearClipRegion() { push("clearClip"); }

void CommandCompositor::drawBorder(const Bounds& bounds) {
  auto& alloc = commands_.GetAllocator();
  push("border").AddMember("bounds", boundsValue(bounds, alloc), alloc);
}

std::string CommandCompositor::frameJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  writer.StartObject();
  writer.Key("frame");
  writer.Uint64(frame_);
  writer.Key("width");
  writer.Double(width_);
  writer.Key("height");
  writer.Double(height_);
  writer.Key("commands");
  commands_.Accept(writer);
  writer.EndObject();
  return sb.GetString();
}

std::vector<std::string> CommandCompositor::ops() const {
  std::vector<std::string> out;
  out.reserve(commands_.Size());
  for (const auto& c : commands_.GetArray()) out.push_back(c["op"].GetString());
  return out;
}

} // namespace oc
