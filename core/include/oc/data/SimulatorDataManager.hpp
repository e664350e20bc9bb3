#pragma once
#include "oc/data/DataManager.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace oc {

enum class Volatility : std::uint8_t { Low, Medium, High };

struct SimulatorConfig {
  Volatility volatility{Volatility::Medium};
  std::int64_t candleIntervalMs{60 * 1000};
  std::int64_t startTimeMs{1700000000000};  // newest historical candle ends here
  double startPrice{100.0};
  int ticksPerCandle{20};
  int historicalBatchSize{100};
  int initialHistoricalCount{500};          // total history available
  std::uint32_t seed{42};
};

// Random-walk candle generator. History is produced backwards in time, one
// batch per loadHistorical() call; tick() advances the forming candle and
// pushes it to the realtime callback. The host owns the timer that calls tick().
class SimulatorDataManager : public DataManager {
public:
  explicit SimulatorDataManager(const SimulatorConfig& config);

  void loadHistorical(HistoricalCallback done) override;
  void onRealtimeUpdate(RealtimeCallback cb) override;

  // One price movement. Returns the forming candle after the move.
  OhlcCandle tick();

  int loadedHistoricalCount() const { return loadedHistorical_; }
  std::size_t tickCount() const { return tickCount_; }
  double currentPrice() const { return price_; }

private:
  struct VolatilityParams {
    double priceChangePercent;
    double volumeBase;
    double volumeVariance;
  };

  VolatilityParams params() const;
  double nextRandom();  // [0, 1]
  double volumeScaling(double priceChange, double open) const;
  OhlcCandle generateBackwards(std::int64_t timestamp);

  SimulatorConfig config_;
  RealtimeCallback realtime_;
  std::uint32_t seed_;

  // Historical generation walks backwards from the oldest candle.
  int loadedHistorical_{0};
  std::int64_t oldestTimestamp_;
  double oldestOpen_;

  // Realtime state.
  bool hasForming_{false};
  OhlcCandle forming_;
  double price_;
  std::size_t tickCount_{0};
  int ticksInCandle_{0};
};

} // namespace oc
