#include "oc/axis/Axis.hpp"
#include "oc/style/Theme.hpp"

#include <cmath>

namespace oc {

AxisStyle axisStyleFromTheme(const Theme& theme) {
  AxisStyle s;
  s.gridColor = theme.gridColor;
  s.tickColor = theme.tickColor;
  s.labelColor = theme.tickLabelColor;
  s.gridLineWidth = theme.gridLineWidth;
  s.tickLineWidth = theme.tickLineWidth;
  s.fontSize = theme.axisFontSize;
  return s;
}

void Axis::gridShapes(const Bounds& bounds, ShapeList& out) const {
  if (!options_.showGrid) return;

  for (const auto& t : ticks()) {
    if (!std::isfinite(t.position)) continue;
    LineShape line;
    if (horizontal()) {
      line.start = {t.position, bounds.y};
      line.end = {t.position, bounds.bottom()};
    } else {
      line.start = {bounds.x, t.position};
      line.end = {bounds.right(), t.position};
    }
    line.color = style_.gridColor;
    line.lineWidth = style_.gridLineWidth;
    out.lines.push_back(line);
  }
}

void Axis::axisLineShape(const Bounds& bounds, ShapeList& out) const {
  LineShape line;
  switch (position_) {
    case AxisPosition::Bottom:
      line.start = {bounds.x, bounds.bottom()};
      line.end = {bounds.right(), bounds.bottom()};
      break;
    case AxisPosition::Top:
      line.start = {bounds.x, bounds.y};
      line.end = {bounds.right(), bounds.y};
      break;
    case AxisPosition::Left:
      line.start = {bounds.x, bounds.y};
      line.end = {bounds.x, bounds.bottom()};
      break;
    case AxisPosition::Right:
      line.start = {bounds.right(), bounds.y};
      line.end = {bounds.right(), bounds.bottom()};
      break;
  }
  line.color = style_.tickColor;
  line.lineWidth = style_.tickLineWidth;
  out.lines.push_back(line);
}

Point Axis::labelPosition(double tickPos, const Bounds& bounds) const {
  const double offset = options_.tickLength + options_.tickLabelOffset;
  switch (position_) {
    case AxisPosition::Bottom: return {tickPos, bounds.bottom() + offset};
    case AxisPosition::Top:    return {tickPos, bounds.y - offset};
    case AxisPosition::Left:   return {bounds.x - offset, tickPos};
    case AxisPosition::Right:  return {bounds.right() + offset, tickPos};
  }
  return {tickPos, tickPos};
}

void Axis::labelShapes(const Bounds& bounds, ShapeList& out) const {
  if (!options_.showLabels) return;

  TextAlign align = TextAlign::Left;
  TextBaseline baseline = TextBaseline::Middle;
  switch (position_) {
    case AxisPosition::Bottom: align = TextAlign::Center; baseline = TextBaseline::Top; break;
    case AxisPosition::Top:    align = TextAlign::Center; baseline = TextBaseline::Bottom; break;
    case AxisPosition::Left:   align = TextAlign::Right;  baseline = TextBaseline::Middle; break;
    case AxisPosition::Right:  align = TextAlign::Left;   baseline = TextBaseline::Middle; break;
  }

  const double lo = horizontal() ? bounds.x : bounds.y;
  const double hi = horizontal() ? bounds.right() : bounds.bottom();

  for (const auto& t : ticks()) {
    if (t.label.empty()) continue;
    // Off-pane and NaN positions.
    if (!(t.position >= lo && t.position <= hi)) continue;

    TextShape text;
    text.position = labelPosition(t.position, bounds);
    text.text = t.label;
    text.color = style_.labelColor;
    text.fontSize = style_.fontSize;
    text.align = align;
    text.baseline = baseline;
    out.texts.push_back(text);
  }
}

} // namespace oc
