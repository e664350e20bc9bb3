#pragma once
#include "oc/layout/Pane.hpp"

namespace oc {

// Candle study plus overlays that share the common price scale.
class MainPane : public Pane {
public:
  static constexpr int kAxisTicks = 8;

  MainPane(std::unique_ptr<Study> candleStudy, const NumericScale& priceScale);

  Study& candleStudy() { return primaryStudy(); }

  void addOverlayStudy(std::unique_ptr<Study> study) { addStudy(std::move(study)); }
  bool removeOverlayStudy(const std::string& id) { return removeStudy(id); }
  std::size_t overlayCount() const { return studies_.size() - 1; }
};

} // namespace oc
