#pragma once
#include "oc/study/SeriesStudy.hpp"

namespace oc {

// One value per candle, computed from that candle alone.
template <typename TValue, typename TBatch>
class InstantStudy : public SeriesStudy<TValue, TBatch> {
public:
  InstantStudy(std::string id, std::string name)
      : SeriesStudy<TValue, TBatch>(std::move(id), std::move(name)) {}

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
  virtual TValue calculate(const OhlcCandle& candle) const = 0;

private:
  ScaleDomainUpdate computeLatest(const std::vector<OhlcCandle>& candles) {
    if (candles.empty()) return {};
    const std::size_t idx = candles.size() - 1;
    return this->storeLatest(candles[idx], idx, calculate(candles[idx]));
  }

  ScaleDomainUpdate recomputeAll(const std::vector<OhlcCandle>& candles) {
    this->beginReset();
    this->data_.reserve(candles.size());
    for (std::size_t i = 0; i < candles.size(); ++i) {
      this->data_.push_back({candles[i].timestamp, calculate(candles[i]), i});
    }
    return this->finishReset();
  }
};

} // namespace oc
