#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace oc {

struct VisibleIndices {
  double startIndex, endIndex;
};

// Maps timestamps to pixel X by candle index rather than elapsed time, so
// closed-market gaps take no space. The visible window [start, end] is
// fractional to allow smooth zoom and pan.
class OrdinalTimeScale {
public:
  // endIndex < 0 means "last candle".
  OrdinalTimeScale(std::vector<std::int64_t> domain,
                   double rangeMin, double rangeMax,
                   double startIndex = 0.0, double endIndex = -1.0);

  // NaN when the domain is empty or the window is not finite.
  // Searches only the visible window +/- 2 candles.
  double scaledValue(std::int64_t timestamp) const;

  // O(1) form for callers that already hold the candle index.
  double scaledValueFromIndex(double index) const;

  // Pixel -> nearest candle index, clamped to [0, n-1].
  // Throws std::runtime_error on an empty domain.
  std::size_t invert(double pixel) const;

  void updateVisibleDomainIndices(double startIndex, double endIndex);
  void updateRange(double rangeMin, double rangeMax);
  void updateFullDomain(std::vector<std::int64_t> domain);
  void appendDomainValue(std::int64_t timestamp);

  double boxWidth() const { return step_; }
  VisibleIndices visibleDomainIndices() const { return {startIndex_, endIndex_}; }
  std::vector<std::int64_t> visibleDomain() const;
  const std::vector<std::int64_t>& fullDomain() const { return domain_; }
  std::size_t size() const { return domain_.size(); }
  double rangeMin() const { return rangeMin_; }
  double rangeMax() const { return rangeMax_; }

  std::uint64_t version() const { return version_; }

private:
  void recomputeStep();
  // Exact match, else the closer neighbour (ties resolve to the left).
  std::size_t findIndex(std::int64_t timestamp, std::size_t lo, std::size_t hi) const;

  std::vector<std::int64_t> domain_;
  double rangeMin_;
  double rangeMax_;
  double startIndex_;
  double endIndex_;
  double step_{0.0};
  std::uint64_t version_{0};
};

} // namespace oc
