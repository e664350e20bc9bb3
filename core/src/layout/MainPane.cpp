#include "oc/layout/MainPane.hpp"

namespace oc {

MainPane::MainPane(std::unique_ptr<Study> candleStudy, const NumericScale& priceScale)
    : Pane(std::move(candleStudy), &priceScale, kAxisTicks) {}

} // namespace oc
