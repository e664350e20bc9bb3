#pragma once
#include "oc/shapes/Shapes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace oc {

struct Theme;

enum class AxisPosition : std::uint8_t { Top, Bottom, Left, Right };

struct AxisOptions {
  double tickLength{6.0};
  double tickLabelOffset{8.0};
  bool showGrid{true};
  bool showLabels{true};
};

struct AxisStyle {
  Color gridColor{colorFromHex(0x2F3336)};
  Color tickColor{colorFromHex(0x71767B)};
  Color labelColor{colorFromHex(0x8B98A5)};
  float gridLineWidth{1.0f};
  float tickLineWidth{1.0f};
  float fontSize{11.0f};
};

AxisStyle axisStyleFromTheme(const Theme& theme);

// `value` is the domain value (price, or timestamp ms for time axes).
struct TickInfo {
  double value{0};
  double position{0};
  std::string label;
};

// Produces grid lines, the axis line and tick labels for one pane edge.
// Shapes are appended to the caller's ShapeList.
class Axis {
public:
  explicit Axis(AxisPosition position, const AxisOptions& options = {})
      : position_(position), options_(options) {}
  virtual ~Axis() = default;

  virtual std::vector<TickInfo> ticks() const = 0;

  void gridShapes(const Bounds& bounds, ShapeList& out) const;
  void axisLineShape(const Bounds& bounds, ShapeList& out) const;
  void labelShapes(const Bounds& bounds, ShapeList& out) const;

  AxisPosition position() const { return position_; }
  const AxisOptions& options() const { return options_; }
  void setOptions(const AxisOptions& options) { options_ = options; }
  const AxisStyle& style() const { return style_; }
  void setStyle(const AxisStyle& style) { style_ = style; }

protected:
  bool horizontal() const {
    return position_ == AxisPosition::Top || position_ == AxisPosition::Bottom;
  }

private:
  Point labelPosition(double tickPos, const Bounds& bounds) const;

  AxisPosition position_;
  AxisOptions options_;
  AxisStyle style_;
};

} // namespace oc
