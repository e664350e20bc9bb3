#pragma once
#include "oc/layout/Pane.hpp"

namespace oc {

// Indicator strip below the main pane. The primary study must own a Y scale,
// which the pane's axis shows. Other studies keep their own Y mapping: a
// private scale when they have one, otherwise the shared price scale.
class SubPane : public Pane {
public:
  static constexpr int kAxisTicks = 6;

  // Throws std::invalid_argument when the primary study has no Y scale or
  // heightPercent is outside (0, 1).
  SubPane(std::string id, std::unique_ptr<Study> primary, double heightPercent,
          std::vector<std::unique_ptr<Study>> others = {});

  const std::string& id() const { return id_; }
  double heightPercent() const { return heightPercent_; }
  const NumericScale* yScale() const { return primaryStudy().yScale(); }

  // Forwards the bounds to each study's private scale.
  void setBounds(const Bounds& bounds) override;

private:
  std::string id_;
  double heightPercent_;
};

} // namespace oc
