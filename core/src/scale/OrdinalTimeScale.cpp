#include "oc/scale/OrdinalTimeScale.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace oc {

static constexpr double kSearchBuffer = 2.0;

OrdinalTimeScale::OrdinalTimeScale(std::vector<std::int64_t> domain,
                                   double rangeMin, double rangeMax,
                                   double startIndex, double endIndex)
    : domain_(std::move(domain)), rangeMin_(rangeMin), rangeMax_(rangeMax),
      startIndex_(startIndex),
      endIndex_(endIndex < 0.0 ? static_cast<double>(domain_.size()) - 1.0 : endIndex) {
  recomputeStep();
}

void OrdinalTimeScale::recomputeStep() {
  // Count, not span: n visible candles must fit inside the pixel range.
  double visibleCount = std::max(1.0, endIndex_ - startIndex_ + 1.0);
  step_ = (rangeMax_ - rangeMin_) / visibleCount;
}

std::size_t OrdinalTimeScale::findIndex(std::int64_t timestamp,
                                        std::size_t lo, std::size_t hi) const {
  // Half-open search over [lo, hi].
  std::size_t left = lo;
  std::size_t right = hi + 1;
  while (left < right) {
    std::size_t mid = left + (right - left) / 2;
    if (domain_[mid] == timestamp) return mid;
    if (domain_[mid] < timestamp) left = mid + 1;
    else right = mid;
  }

  if (left >= domain_.size()) return domain_.size() - 1;
  if (left == 0) return 0;

  std::int64_t distLeft = timestamp - domain_[left - 1];
  std::int64_t distRight = domain_[left] - timestamp;
  if (distLeft < 0) distLeft = -distLeft;
  if (distRight < 0) distRight = -distRight;
  return distLeft <= distRight ? left - 1 : left;
}

double OrdinalTimeScale::scaledValue(std::int64_t timestamp) const {
  if (domain_.empty() || !std::isfinite(startIndex_) || !std::isfinite(endIndex_))
    return std::numeric_limits<double>::quiet_NaN();

  double last = static_cast<double>(domain_.size() - 1);
  double lo = std::max(0.0, std::floor(startIndex_ - kSearchBuffer));
  double hi = std::min(last, std::ceil(endIndex_ + kSearchBuffer));
  if (lo > hi) lo = hi;

  std::size_t idx = findIndex(timestamp, static_cast<std::size_t>(lo),
                              static_cast<std::size_t>(hi));
  return scaledValueFromIndex(static_cast<double>(idx));
}

double OrdinalTimeScale::scaledValueFromIndex(double index) const {
  if (domain_.empty() || !std::isfinite(index))
    return std::numeric_limits<double>::quiet_NaN();
  return rangeMin_ + step_ / 2.0 + (index - startIndex_) * step_;
}

std::size_t OrdinalTimeScale::invert(double pixel) const {
  if (domain_.empty())
    throw std::runtime_error("OrdinalTimeScale: cannot invert on an empty domain");

  double rel = step_ != 0.0 ? (pixel - rangeMin_ - step_ / 2.0) / step_ : 0.0;
  double full = std::round(rel + startIndex_);
  double last = static_cast<double>(domain_.size() - 1);
  if (!(full >= 0.0)) full = 0.0;  // also catches NaN
  if (full > last) full = last;
  return static_cast<std::size_t>(full);
}

void OrdinalTimeScale::updateVisibleDomainIndices(double startIndex, double endIndex) {
  startIndex_ = std::max(0.0, startIndex);
  endIndex_ = std::min(static_cast<double>(domain_.size()) - 1.0, endIndex);
  recomputeStep();
  ++version_;
}

void OrdinalTimeScale::updateRange(double rangeMin, double rangeMax) {
  rangeMin_ = rangeMin;
  rangeMax_ = rangeMax;
  recomputeStep();
  ++version_;
}

void OrdinalTimeScale::updateFullDomain(std::vector<std::int64_t> domain) {
  domain_ = std::move(domain);
  endIndex_ = std::min(endIndex_, static_cast<double>(domain_.size()) - 1.0);
  recomputeStep();
  ++version_;
}

void OrdinalTimeScale::appendDomainValue(std::int64_t timestamp) {
  domain_.push_back(timestamp);
  ++version_;
}

std::vector<std::int64_t> OrdinalTimeScale::visibleDomain() const {
  if (domain_.empty() || !std::isfinite(startIndex_) || !std::isfinite(endIndex_))
    return {};

  double first = std::max(0.0, std::floor(startIndex_));
  double last = std::min(static_cast<double>(domain_.size()) - 1.0, std::ceil(endIndex_));
  if (first > last) return {};

  return std::vector<std::int64_t>(
      domain_.begin() + static_cast<std::ptrdiff_t>(first),
      domain_.begin() + static_cast<std::ptrdiff_t>(last) + 1);
}

} // namespace oc
