#include "oc/data/SimulatorDataManager.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace oc {

SimulatorDataManager::SimulatorDataManager(const SimulatorConfig& config)
    : config_(config), seed_(config.seed),
      oldestTimestamp_(config.startTimeMs), oldestOpen_(config.startPrice),
      price_(config.startPrice) {
  if (config_.candleIntervalMs <= 0) config_.candleIntervalMs = 60 * 1000;
  if (config_.ticksPerCandle < 1) config_.ticksPerCandle = 1;
  if (config_.historicalBatchSize < 1) config_.historicalBatchSize = 1;
}

SimulatorDataManager::VolatilityParams SimulatorDataManager::params() const {
  switch (config_.volatility) {
    case Volatility::Low:    return {0.0005, 50000.0, 20000.0};
    case Volatility::High:   return {0.002, 200000.0, 100000.0};
    case Volatility::Medium:
    default:                 return {0.001, 100000.0, 50000.0};
  }
}

double SimulatorDataManager::nextRandom() {
  // RNG: simple LCG
  seed_ = seed_ * 1103515245u + 12345u;
  return static_cast<double>((seed_ >> 16) & 0x7FFF) / 32767.0;
}

double SimulatorDataManager::volumeScaling(double priceChange, double open) const {
  if (open == 0.0 || !std::isfinite(open)) return 1.0;
  double pct = std::fabs(priceChange / open);
  if (!std::isfinite(pct)) return 1.0;
  return 1.0 + pct * 10.0;
}

OhlcCandle SimulatorDataManager::generateBackwards(std::int64_t timestamp) {
  auto p = params();

  // The next-newer candle opened at oldestOpen_; this one closes there.
  double close = oldestOpen_;
  double open = close;
  double high = close;
  double low = close;

  for (int i = 0; i < config_.ticksPerCandle; i++) {
    open += (nextRandom() - 0.5) * 2.0 * p.priceChangePercent * open;
    high = std::max(high, open);
    low = std::min(low, open);
  }

  double volume = (p.volumeBase + (nextRandom() - 0.5) * p.volumeVariance) *
                  volumeScaling(close - open, open);
  if (!std::isfinite(volume) || volume < 0.0) volume = p.volumeBase;

  oldestOpen_ = open;

  OhlcCandle c;
  c.timestamp = timestamp;
  c.open = open;
  c.high = high;
  c.low = low;
  c.close = close;
  c.volume = volume;
  return c;
}

void SimulatorDataManager::loadHistorical(HistoricalCallback done) {
  HistoricalBatch batch;

  int remaining = config_.initialHistoricalCount - loadedHistorical_;
  int count = std::min(remaining, config_.historicalBatchSize);

  if (count > 0) {
    batch.candles.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; i++) {
      batch.candles.push_back(generateBackwards(oldestTimestamp_));
      oldestTimestamp_ -= config_.candleIntervalMs;
    }
    std::reverse(batch.candles.begin(), batch.candles.end());

    // The first batch also seeds the realtime walk from the newest close.
    if (loadedHistorical_ == 0) price_ = batch.candles.back().close;
    loadedHistorical_ += count;
  }

  batch.hasMore = loadedHistorical_ < config_.initialHistoricalCount;
  std::fprintf(stderr, "[SimulatorDataManager] historical batch: %zu candles, hasMore=%d\n",
               batch.candles.size(), batch.hasMore ? 1 : 0);

  if (done) done(batch);
}

void SimulatorDataManager::onRealtimeUpdate(RealtimeCallback cb) {
  realtime_ = std::move(cb);
}

OhlcCandle SimulatorDataManager::tick() {
  auto p = params();

  if (!hasForming_ || ticksInCandle_ >= config_.ticksPerCandle) {
    std::int64_t ts = hasForming_
        ? forming_.timestamp + config_.candleIntervalMs
        : config_.startTimeMs + config_.candleIntervalMs;
    forming_ = OhlcCandle{};
    forming_.timestamp = ts;
    forming_.open = forming_.high = forming_.low = forming_.close = price_;
    hasForming_ = true;
    ticksInCandle_ = 0;
  }

  price_ += (nextRandom() - 0.5) * 2.0 * p.priceChangePercent * price_;

  double tickVolume = p.volumeBase / 100.0 *
                      volumeScaling(price_ - forming_.open, forming_.open);
  if (!std::isfinite(tickVolume) || tickVolume < 0.0) tickVolume = p.volumeBase / 100.0;

  forming_.high = std::max(forming_.high, price_);
  forming_.low = std::min(forming_.low, price_);
  forming_.close = price_;
  forming_.volume += tickVolume;

  tickCount_++;
  ticksInCandle_++;

  if (realtime_) realtime_(forming_);
  return forming_;
}

} // namespace oc
