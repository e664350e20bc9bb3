#pragma once
#include "oc/scale/CommonScaleManager.hpp"
#include "oc/render/Compositor.hpp"
#include "oc/study/Study.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace oc {

// Shared machinery for studies that produce one value per candle and draw
// them as a single shape batch: computed-value storage, price-bound tracking
// and the epoch-keyed render cache.
template <typename TValue, typename TBatch>
class SeriesStudy : public Study {
public:
  using Value = TValue;
  using PointType = typename TBatch::PointType;
  using DataPoint = ComputedDataPoint<TValue>;

  SeriesStudy(std::string id, std::string name)
      : Study(std::move(id), std::move(name)) {}

  void updateScales(bool timeChanged, bool priceChanged) override {
    if (timeChanged || priceChanged) cache_.invalidate();
  }

  void renderTo(Compositor& compositor, const CommonScaleManager& scales,
                const Bounds& bounds) override {
    (void)bounds;
    if (data_.empty()) return;

    RenderKey key;
    key.dataEpoch = dataEpoch_;
    key.timeVersion = scales.timeScale().version();
    key.valueVersion = valueScale(scales).version();

    if (cache_.needsRebuild(key)) {
      rebuildVisible(scales);
      cache_.store(key);
      ++rebuilds_;
    } else {
      ++reuses_;
    }
    if (!batch_.empty()) compositor.render(batch_);
  }

  const std::vector<DataPoint>& computedData() const { return data_; }
  const TBatch& batch() const { return batch_; }
  TBatch& batch() { return batch_; }

  bool hasValueBounds() const { return yMin_ <= yMax_; }
  DomainRange valueBounds() const { return {yMin_, yMax_}; }

protected:
  // Price extent of one computed value. False when the value should not
  // influence the shared price scale.
  virtual bool priceBounds(const TValue& value, DomainRange& out) const = 0;

  // Pixel-space point for one computed value. `index` is the candle index.
  virtual PointType valueToPoint(const TValue& value, std::size_t index,
                                 const CommonScaleManager& scales) const = 0;

  // Scale the Y coordinates are drawn against.
  virtual const NumericScale& valueScale(const CommonScaleManager& scales) const {
    return scales.priceScale();
  }

  // Store a value for the newest candle: replaces the last point when the
  // timestamps match, otherwise appends. Returns the price-bound change.
  ScaleDomainUpdate storeLatest(const OhlcCandle& candle, std::size_t index,
                                const TValue& value) {
    ++dataEpoch_;
    if (!data_.empty() && data_.back().timestamp == candle.timestamp) {
      TValue old = data_.back().value;
      data_.back().value = value;
      data_.back().index = index;
      return replaceBounds(old, value);
    }
    data_.push_back(DataPoint{candle.timestamp, value, index});
    return extendBounds(value);
  }

  // Drop everything; the caller refills data_ and calls finishReset().
  void beginReset() {
    data_.clear();
    batch_.clear();
    cache_.invalidate();
    ++dataEpoch_;
    yMin_ = std::numeric_limits<double>::infinity();
    yMax_ = -std::numeric_limits<double>::infinity();
  }

  ScaleDomainUpdate finishReset() {
    recomputeBounds();
    if (!hasValueBounds()) return {};
    return ScaleDomainUpdate::y(yMin_, yMax_);
  }

  // Committed value for candle index-1, skipping a point being replaced
  // at `timestamp`. nullptr when there is none.
  const TValue* valueBefore(std::size_t index, std::int64_t timestamp) const {
    if (data_.empty() || index == 0) return nullptr;
    std::size_t pos = data_.size() - 1;
    if (data_[pos].timestamp == timestamp) {
      if (pos == 0) return nullptr;
      --pos;
    }
    if (data_[pos].index + 1 != index) return nullptr;
    return &data_[pos].value;
  }

  std::vector<DataPoint> data_;
  TBatch batch_;
  std::uint64_t dataEpoch_{0};
  RenderCache cache_;

private:
  ScaleDomainUpdate extendBounds(const TValue& value) {
    DomainRange r;
    if (!priceBounds(value, r)) return {};
    bool changed = false;
    if (r.min < yMin_) {
      yMin_ = r.min;
      changed = true;
    }
    if (r.max > yMax_) {
      yMax_ = r.max;
      changed = true;
    }
    if (!changed) return {};
    return ScaleDomainUpdate::y(yMin_, yMax_);
  }

  ScaleDomainUpdate replaceBounds(const TValue& oldValue, const TValue& newValue) {
    DomainRange before{yMin_, yMax_};
    DomainRange oldR;
    bool oldHad = priceBounds(oldValue, oldR);
    // The replaced value held an extreme; it may have shrunk.
    if (oldHad && (oldR.min <= yMin_ || oldR.max >= yMax_)) {
      recomputeBounds();
    } else {
      extendBounds(newValue);
    }
    if (!hasValueBounds()) return {};
    if (before.min == yMin_ && before.max == yMax_) return {};
    return ScaleDomainUpdate::y(yMin_, yMax_);
  }

  void recomputeBounds() {
    yMin_ = std::numeric_limits<double>::infinity();
    yMax_ = -std::numeric_limits<double>::infinity();
    DomainRange r;
    for (const auto& dp : data_) {
      if (!priceBounds(dp.value, r)) continue;
      yMin_ = std::min(yMin_, r.min);
      yMax_ = std::max(yMax_, r.max);
    }
  }

  // Visible window +/- 2 candles so partially visible edges still draw.
  void rebuildVisible(const CommonScaleManager& scales) {
    auto& pts = batch_.mutablePoints();
    pts.clear();

    const auto vi = scales.visibleDomainIndices();
    if (!std::isfinite(vi.startIndex) || !std::isfinite(vi.endIndex)) return;

    const double lo = std::max(0.0, std::floor(vi.startIndex) - 2.0);
    const double hi = std::ceil(vi.endIndex) + 2.0;
    if (hi < lo) return;

    const std::size_t first = static_cast<std::size_t>(lo);
    auto it = std::lower_bound(data_.begin(), data_.end(), first,
                               [](const DataPoint& dp, std::size_t idx) {
                                 return dp.index < idx;
                               });
    for (; it != data_.end() && static_cast<double>(it->index) <= hi; ++it) {
      pts.push_back(valueToPoint(it->value, it->index, scales));
    }
  }

  double yMin_{std::numeric_limits<double>::infinity()};
  double yMax_{-std::numeric_limits<double>::infinity()};
};

} // namespace oc
