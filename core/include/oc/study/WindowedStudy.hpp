#pragma once
#include "oc/study/SeriesStudy.hpp"

#include <stdexcept>

namespace oc {

// Window length for a user-facing period. Throws std::invalid_argument for
// periods below 1.
inline std::size_t windowForPeriod(int period) {
  if (period < 1) throw std::invalid_argument("Study: period must be >= 1");
  return static_cast<std::size_t>(period);
}

// One value per candle from the trailing `windowSize` candles. Candles with
// an incomplete window produce no value, so the first computed point sits at
// candle index windowSize-1.
template <typename TValue, typename TBatch>
class WindowedStudy : public SeriesStudy<TValue, TBatch> {
public:
  WindowedStudy(std::string id, std::string name, std::size_t windowSize)
      : SeriesStudy<TValue, TBatch>(std::move(id), std::move(name)),
        windowSize_(windowSize) {
    if (windowSize_ == 0) {
      throw std::invalid_argument("WindowedStudy: window size must be positive");
    }
  }

  std::size_t windowSize() const { return windowSize_; }

  ScaleDomainUpdate updateLastCandle(const std::vector<OhlcCandle>& candles) override {
    return computeLatest(candles);
  }

  ScaleDomainUpdate appendNewCandle(const std::vector<OhlcCandle>& candles) override {
    return computeLatest(candles);
  }

  ScaleDomainUpdate prependHistoricalCandles(const std::vector<OhlcCandle>& candles) override {
    return recomputeAll(candles);
  }

  ScaleDomainUpdate resetCandles(const std::vector<OhlcCandle>& candles) override {
    return recomputeAll(candles);
  }

protected:
  // `window` holds windowSize() candles ending at candle `index`. `previous`
  // is this study's value at index-1 when one exists. Return false to emit
  // no value for this candle.
  virtual bool calculate(const OhlcCandle* window, std::size_t index,
                         const TValue* previous, TValue& out) const = 0;

private:
  ScaleDomainUpdate computeLatest(const std::vector<OhlcCandle>& candles) {
    const std::size_t n = candles.size();
    if (n < windowSize_) return {};
    const std::size_t idx = n - 1;
    const OhlcCandle& last = candles[idx];

    TValue value{};
    const TValue* prev = this->valueBefore(idx, last.timestamp);
    if (!calculate(&candles[n - windowSize_], idx, prev, value)) return {};
    return this->storeLatest(last, idx, value);
  }

  ScaleDomainUpdate recomputeAll(const std::vector<OhlcCandle>& candles) {
    this->beginReset();
    const std::size_t n = candles.size();
    if (n >= windowSize_) this->data_.reserve(n - windowSize_ + 1);
    for (std::size_t i = windowSize_ - 1; i < n; ++i) {
      const TValue* prev = this->data_.empty() || this->data_.back().index + 1 != i
                               ? nullptr
                               : &this->data_.back().value;
      TValue value{};
      if (!calculate(&candles[i + 1 - windowSize_], i, prev, value)) continue;
      this->data_.push_back({candles[i].timestamp, value, i});
    }
    return this->finishReset();
  }

  std::size_t windowSize_;
};

} // namespace oc
