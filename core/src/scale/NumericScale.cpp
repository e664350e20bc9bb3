#include "oc/scale/NumericScale.hpp"

namespace oc {

NumericScale::NumericScale(double domainMin, double domainMax,
                           double rangeMin, double rangeMax,
                           bool inverted, int tickCount)
    : rangeMin_(rangeMin), rangeMax_(rangeMax),
      inverted_(inverted), tickCount_(tickCount) {
  domain_ = scaleNice(domainMin, domainMax, tickCount_);
}

void NumericScale::updateDomain(double domainMin, double domainMax) {
  domain_ = scaleNice(domainMin, domainMax, tickCount_);
  ++version_;
}

void NumericScale::updateRange(double rangeMin, double rangeMax) {
  rangeMin_ = rangeMin;
  rangeMax_ = rangeMax;
  ++version_;
}

void NumericScale::setInverted(bool inverted) {
  inverted_ = inverted;
  ++version_;
}

double NumericScale::scaledValue(double value) const {
  double span = domain_.max - domain_.min;
  if (span == 0.0) return rangeMin_;

  double ratio = (value - domain_.min) / span;
  if (inverted_) return rangeMax_ - ratio * (rangeMax_ - rangeMin_);
  return rangeMin_ + ratio * (rangeMax_ - rangeMin_);
}

double NumericScale::invert(double pixel) const {
  double rangeSpan = rangeMax_ - rangeMin_;
  if (rangeSpan == 0.0) return domain_.min;

  double ratio = inverted_ ? (rangeMax_ - pixel) / rangeSpan
                           : (pixel - rangeMin_) / rangeSpan;
  return domain_.min + ratio * (domain_.max - domain_.min);
}

} // namespace oc
