#pragma once
#include "oc/debug/Stats.hpp"
#include "oc/shapes/Shapes.hpp"

namespace oc {

class CommonScaleManager;
class Compositor;
class Pane;
class PaneManager;
class TimeAxis;

struct Padding {
  double top{20.0};
  double right{60.0};
  double bottom{30.0};
  double left{10.0};
};

// Stacks the panes vertically inside the padded chart area and drives the
// per-frame render pass. Layout only changes on resize, padding or pane
// changes; render() never touches it.
class MultiPaneRenderer {
public:
  static constexpr double kPaneSpacing = 16.0;

  // Calls setupHighDPI and lays the panes out.
  MultiPaneRenderer(Compositor& compositor, PaneManager& panes, CommonScaleManager& scales,
                    const TimeAxis& timeAxis, double width, double height,
                    const Padding& padding = {});

  void setSize(double width, double height);
  void setPadding(const Padding& padding);

  // Throws std::invalid_argument when the sub-panes leave no room for the
  // main pane.
  void recalculateLayout();

  // Layers: grid, clipped pane content, unclipped infrastructure, border,
  // axis lines, axis labels.
  void render();

  Bounds chartArea() const;
  double width() const { return width_; }
  double height() const { return height_; }
  const Padding& padding() const { return padding_; }

  const Stats& stats() const { return stats_; }
  DebugToggles& debug() { return stats_.debug; }

private:
  void renderPaneClipped(Pane& pane);
  void emit(const ShapeList& shapes);

  Compositor& compositor_;
  PaneManager& panes_;
  CommonScaleManager& scales_;
  const TimeAxis& timeAxis_;
  double width_;
  double height_;
  Padding padding_;
  Stats stats_;
  ShapeList scratch_;
};

} // namespace oc
