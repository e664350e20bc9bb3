#pragma once

namespace oc {

class CommonScaleManager;

struct ZoomManagerConfig {
  double minVisibleCandles{10.0};
  double maxVisibleCandles{2500.0};
  double zoomFactor{1.2};       // default for zoomIn()/zoomOut() without a factor
};

// Right-anchored zoom and bounded pan over the shared time scale's visible
// window. "Visible range" is endIndex - startIndex.
class ZoomManager {
public:
  explicit ZoomManager(CommonScaleManager& scales);

  void setConfig(const ZoomManagerConfig& cfg) { config_ = cfg; }
  const ZoomManagerConfig& config() const { return config_; }

  // Each mutator returns true if the visible window changed.
  bool zoomIn() { return zoomIn(config_.zoomFactor); }
  bool zoomIn(double factor);
  bool zoomOut() { return zoomOut(config_.zoomFactor); }
  bool zoomOut(double factor);

  // Shift by deltaCandles. At either boundary the window is clamped while the
  // visible range is kept exactly.
  bool pan(double deltaCandles);

  bool resetZoom();

  double zoomLevel() const;  // visible / total * 100
  bool canZoomIn() const;
  bool canZoomOut() const;
  bool canPanLeft() const;
  bool canPanRight() const;

private:
  bool apply(double start, double end);

  CommonScaleManager& scales_;
  ZoomManagerConfig config_;
};

} // namespace oc
