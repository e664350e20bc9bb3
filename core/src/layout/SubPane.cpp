#include "oc/layout/SubPane.hpp"

#include <stdexcept>

namespace oc {

SubPane::SubPane(std::string id, std::unique_ptr<Study> primary, double heightPercent,
                 std::vector<std::unique_ptr<Study>> others)
    : Pane(std::move(primary), nullptr, kAxisTicks),
      id_(std::move(id)),
      heightPercent_(heightPercent) {
  if (!(heightPercent_ > 0.0 && heightPercent_ < 1.0)) {
    throw std::invalid_argument("SubPane: heightPercent must be in (0, 1)");
  }
  for (auto& s : others) addStudy(std::move(s));
}

void SubPane::setBounds(const Bounds& bounds) {
  Pane::setBounds(bounds);
  for (auto& s : studies_) s->updateScaleBounds(bounds);
}

} // namespace oc
