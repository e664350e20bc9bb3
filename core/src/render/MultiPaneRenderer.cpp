#include "oc/render/MultiPaneRenderer.hpp"
#include "oc/axis/TimeAxis.hpp"
#include "oc/layout/PaneManager.hpp"
#include "oc/render/Compositor.hpp"
#include "oc/scale/CommonScaleManager.hpp"

#include <chrono>
#include <stdexcept>

namespace oc {

MultiPaneRenderer::MultiPaneRenderer(Compositor& compositor, PaneManager& panes,
                                     CommonScaleManager& scales, const TimeAxis& timeAxis,
                                     double width, double height, const Padding& padding)
    : compositor_(compositor), panes_(panes), scales_(scales), timeAxis_(timeAxis),
      width_(width), height_(height), padding_(padding) {
  compositor_.setupHighDPI(width_, height_);
  recalculateLayout();
}

void MultiPaneRenderer::setSize(double width, double height) {
  width_ = width;
  height_ = height;
  compositor_.setupHighDPI(width_, height_);
  recalculateLayout();
}

void MultiPaneRenderer::setPadding(const Padding& padding) {
  padding_ = padding;
  recalculateLayout();
}

Bounds MultiPaneRenderer::chartArea() const {
  return {padding_.left, padding_.top, width_ - padding_.left - padding_.right,
          height_ - padding_.top - padding_.bottom};
}

void MultiPaneRenderer::recalculateLayout() {
  const Bounds area = chartArea();
  const auto& subs = panes_.subPanes();

  double subTotal = 0.0;
  for (const auto& sp : subs) subTotal += sp->heightPercent();
  const double mainPercent = 1.0 - subTotal;
  if (mainPercent <= 0.0) {
    throw std::invalid_argument(
        "MultiPaneRenderer: sub-pane heights leave no room for the main pane");
  }

  const double available = area.height - kPaneSpacing * static_cast<double>(subs.size());
  double y = area.y;

  const double mainHeight = available * mainPercent;
  panes_.mainPane().setBounds({area.x, y, area.width, mainHeight});
  scales_.updatePriceRange(y, y + mainHeight);
  y += mainHeight + kPaneSpacing;

  for (const auto& sp : subs) {
    const double h = available * sp->heightPercent();
    sp->setBounds({area.x, y, area.width, h});
    y += h + kPaneSpacing;
  }

  scales_.updateTimeRange(area.x, area.right());
}

void MultiPaneRenderer::emit(const ShapeList& shapes) {
  if (shapes.empty()) return;
  compositor_.renderShapes(shapes);
  ++stats_.drawCalls;
}

void MultiPaneRenderer::renderPaneClipped(Pane& pane) {
  compositor_.setClipRegion(pane.bounds());
  pane.renderTo(compositor_, scales_);
  compositor_.clearClipRegion();
}

void MultiPaneRenderer::render() {
  const auto t0 = std::chrono::steady_clock::now();
  stats_.drawCalls = 0;

  MainPane& main = panes_.mainPane();
  const auto& subs = panes_.subPanes();
  const Pane& bottom = subs.empty() ? static_cast<const Pane&>(main) : *subs.back();

  compositor_.clear();

  // Grid
  scratch_.clear();
  main.priceAxisGridShapes(scratch_);
  for (const auto& sp : subs) sp->priceAxisGridShapes(scratch_);
  timeAxis_.gridShapes(main.bounds(), scratch_);
  for (const auto& sp : subs) timeAxis_.gridShapes(sp->bounds(), scratch_);
  emit(scratch_);

  // Content
  renderPaneClipped(main);
  for (const auto& sp : subs) renderPaneClipped(*sp);

  // Infrastructure (price labels over the axis area)
  main.renderInfrastructureTo(compositor_, scales_);
  for (const auto& sp : subs) sp->renderInfrastructureTo(compositor_, scales_);

  compositor_.drawBorder(chartArea());
  if (stats_.debug.showPaneBounds) {
    compositor_.drawBorder(main.bounds());
    for (const auto& sp : subs) compositor_.drawBorder(sp->bounds());
  }

  // Axis lines
  scratch_.clear();
  main.priceAxisLineShape(scratch_);
  for (const auto& sp : subs) sp->priceAxisLineShape(scratch_);
  timeAxis_.axisLineShape(bottom.bounds(), scratch_);
  emit(scratch_);

  // Labels
  scratch_.clear();
  main.priceAxisLabelShapes(scratch_);
  for (const auto& sp : subs) sp->priceAxisLabelShapes(scratch_);
  timeAxis_.labelShapes(bottom.bounds(), scratch_);
  emit(scratch_);

  std::uint64_t rebuilds = 0;
  std::uint64_t reuses = 0;
  for (const Study* s : panes_.allStudies()) {
    rebuilds += s->rebuildCount();
    reuses += s->reuseCount();
  }
  stats_.batchRebuilds = rebuilds;
  stats_.batchReuses = reuses;

  ++stats_.frameCount;
  const auto t1 = std::chrono::steady_clock::now();
  stats_.frameMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
}

} // namespace oc
