#pragma once
#include "oc/axis/NumericAxis.hpp"
#include "oc/study/Study.hpp"

#include <memory>
#include <string>
#include <vector>

namespace oc {

class CommonScaleManager;
class Compositor;
struct Theme;

// A horizontal strip holding an ordered list of studies and a right-side
// value axis. The first study is the pane's primary study; it is drawn first
// and cannot be removed.
class Pane {
public:
  // A null axisScale means the primary study's own Y scale; throws
  // std::invalid_argument when there is none.
  Pane(std::unique_ptr<Study> primary, const NumericScale* axisScale, int axisTicks);
  virtual ~Pane() = default;

  Pane(const Pane&) = delete;
  Pane& operator=(const Pane&) = delete;

  // Lifecycle broadcast. Returns the merged update of every study.
  ScaleDomainUpdate updateLastCandle(const std::vector<OhlcCandle>& candles);
  ScaleDomainUpdate appendNewCandle(const std::vector<OhlcCandle>& candles);
  ScaleDomainUpdate prependHistoricalCandles(const std::vector<OhlcCandle>& candles);
  ScaleDomainUpdate resetCandles(const std::vector<OhlcCandle>& candles);

  void updateScales(bool timeChanged, bool priceChanged);

  virtual void setBounds(const Bounds& bounds) { bounds_ = bounds; }
  const Bounds& bounds() const { return bounds_; }

  void renderTo(Compositor& compositor, const CommonScaleManager& scales);
  void renderInfrastructureTo(Compositor& compositor, const CommonScaleManager& scales);

  void priceAxisGridShapes(ShapeList& out) const { axis_.gridShapes(bounds_, out); }
  void priceAxisLineShape(ShapeList& out) const { axis_.axisLineShape(bounds_, out); }
  void priceAxisLabelShapes(ShapeList& out) const { axis_.labelShapes(bounds_, out); }

  void applyTheme(const Theme& theme);

  Study& primaryStudy() { return *studies_.front(); }
  const Study& primaryStudy() const { return *studies_.front(); }
  std::vector<Study*> allStudies() const;
  Study* findStudy(const std::string& id) const;

  NumericAxis& priceAxis() { return axis_; }
  const NumericAxis& priceAxis() const { return axis_; }

protected:
  static std::vector<std::unique_ptr<Study>> primaryList(std::unique_ptr<Study> primary);
  static const NumericScale& axisScaleFor(const Study& primary, const NumericScale* axisScale);

  void addStudy(std::unique_ptr<Study> study);
  // Never removes the primary study.
  bool removeStudy(const std::string& id);

  std::vector<std::unique_ptr<Study>> studies_;
  Bounds bounds_;
  NumericAxis axis_;
};

} // namespace oc
