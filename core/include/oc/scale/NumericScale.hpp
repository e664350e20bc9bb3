#pragma once
#include "oc/math/NiceScale.hpp"

#include <cstdint>

namespace oc {

// Linear domain <-> pixel mapping. The domain is always snapped outward to
// nice tick multiples. `inverted` maps domain max to rangeMin (canvas Y).
class NumericScale {
public:
  NumericScale(double domainMin, double domainMax,
               double rangeMin, double rangeMax,
               bool inverted = false, int tickCount = 10);

  void updateDomain(double domainMin, double domainMax);
  void updateRange(double rangeMin, double rangeMax);
  void setInverted(bool inverted);

  double scaledValue(double value) const;
  double invert(double pixel) const;

  const NiceDomain& domain() const { return domain_; }
  double rangeMin() const { return rangeMin_; }
  double rangeMax() const { return rangeMax_; }
  bool inverted() const { return inverted_; }
  int tickCount() const { return tickCount_; }

  // Bumped by every mutation; render caches compare against it.
  std::uint64_t version() const { return version_; }

private:
  NiceDomain domain_{0.0, 0.0, 0.0};
  double rangeMin_;
  double rangeMax_;
  bool inverted_;
  int tickCount_;
  std::uint64_t version_{0};
};

} // namespace oc
