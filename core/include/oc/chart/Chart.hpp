#pragma once
#include "oc/axis/TimeAxis.hpp"
#include "oc/chart/ChartController.hpp"
#include "oc/layout/PaneManager.hpp"
#include "oc/render/MultiPaneRenderer.hpp"
#include "oc/scale/CommonScaleManager.hpp"
#include "oc/session/ChartConfig.hpp"
#include "oc/session/ChartState.hpp"
#include "oc/style/Theme.hpp"
#include "oc/viewport/ZoomManager.hpp"

#include <memory>
#include <string>
#include <vector>

namespace oc {

class Compositor;
class DataManager;

struct CandleRange {
  long startIndex{0};
  long endIndex{0};
};

// Public entry point. Wires store, scales, panes, controller, renderer and
// zoom together around a host-supplied DataManager and Compositor, both of
// which must outlive the chart.
//
// Renders are coalesced through renderBatcher(): install a scheduler or call
// flush() from the host loop.
class Chart {
public:
  // Throws std::invalid_argument for an unknown theme name, an unknown study
  // type or an invalid sub-pane layout in `config`.
  Chart(DataManager& dataManager, Compositor& compositor, const ChartConfig& config = {});
  ~Chart();

  Chart(const Chart&) = delete;
  Chart& operator=(const Chart&) = delete;

  // Loads the first historical batch and shows the newest visibleCandles.
  void initialize();

  void addOverlayStudy(std::unique_ptr<Study> study);

  // Throws std::invalid_argument for a bad height, a primary study without a
  // Y scale, a duplicate id, or when the panes no longer fit.
  SubPane& createSubPane(const std::string& id, std::unique_ptr<Study> primaryStudy,
                         double heightPercent,
                         std::vector<std::unique_ptr<Study>> otherStudies = {});
  bool removeSubPane(const std::string& id);

  void updateTheme(const Theme& theme);
  void resize(double width, double height);
  void updatePadding(const Padding& padding);

  void zoomIn();
  void zoomIn(double factor);
  void zoomOut();
  void zoomOut(double factor);
  // Loads older candles when the window nears the oldest one.
  void pan(double deltaCandles);
  void resetZoom();

  double zoomLevel() const { return zoom_.zoomLevel(); }
  bool canZoomIn() const { return zoom_.canZoomIn(); }
  bool canZoomOut() const { return zoom_.canZoomOut(); }
  bool canPanLeft() const { return zoom_.canPanLeft(); }
  bool canPanRight() const { return zoom_.canPanRight(); }

  // Whole-candle window; {0, 0} while the window is not finite.
  CandleRange visibleIndices() const;
  double boxWidth() const { return scales_.timeScale().boxWidth(); }

  ChartState state() const;
  // Returns false, changing nothing, when the state names an unknown theme.
  bool applyState(const ChartState& state);
  void setMetadata(const std::string& symbol, const std::string& timeframe);

  Stats stats() const;
  DebugToggles& debug() { return renderer_.debug(); }

  RenderBatcher& renderBatcher() { return controller_.renderBatcher(); }

  // Stops rendering and ignores further data callbacks.
  void destroy();

  const Theme& theme() const { return theme_; }
  const ChartConfig& config() const { return config_; }
  bool hasMoreHistorical() const { return hasMoreHistorical_; }
  bool isLoadingMore() const { return loadingMore_; }

  const TimeSeriesStore& store() const { return store_; }
  const CommonScaleManager& scales() const { return scales_; }
  PaneManager& paneManager() { return panes_; }
  MainPane& mainPane() { return panes_.mainPane(); }
  TimeAxis& timeAxis() { return timeAxis_; }
  MultiPaneRenderer& renderer() { return renderer_; }

private:
  void attachStudies(const std::vector<StudySpec>& specs);
  void checkAndLoadMore();
  void loadMoreHistorical();
  void recalcAndRender();

  DataManager& data_;
  ChartConfig config_;
  Theme theme_;

  CommonScaleManager scales_;
  PaneManager panes_;
  TimeSeriesStore store_;
  TimeAxis timeAxis_;
  ChartController controller_;
  MultiPaneRenderer renderer_;
  ZoomManager zoom_;

  std::string symbol_;
  std::string timeframe_;
  bool hasMoreHistorical_{true};
  bool loadingMore_{false};
  bool destroyed_{false};
  // Callbacks hold a weak reference so they become no-ops after destroy().
  std::shared_ptr<bool> alive_;
};

} // namespace oc
