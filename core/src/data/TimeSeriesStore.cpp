#include "oc/data/TimeSeriesStore.hpp"

#include <algorithm>

namespace oc {

static bool byTimestamp(const OhlcCandle& a, const OhlcCandle& b) {
  return a.timestamp < b.timestamp;
}

void TimeSeriesStore::add(const OhlcCandle& candle) {
  if (candles_.empty() || candle.timestamp > candles_.back().timestamp) {
    candles_.push_back(candle);
    emit(ChangeKind::Append, 1);
    return;
  }

  if (candle.timestamp == candles_.back().timestamp) {
    candles_.back() = candle;
    emit(ChangeKind::Update, 1);
    return;
  }

  auto it = std::lower_bound(candles_.begin(), candles_.end(), candle, byTimestamp);
  if (it != candles_.end() && it->timestamp == candle.timestamp) {
    *it = candle;
  } else {
    candles_.insert(it, candle);
  }
  emit(ChangeKind::Reset, candles_.size());
}

void TimeSeriesStore::prepend(const std::vector<OhlcCandle>& candles) {
  if (candles.empty()) return;

  std::size_t before = candles_.size();

  // Existing candles first so stable sort + unique keeps them over duplicates.
  std::vector<OhlcCandle> merged;
  merged.reserve(before + candles.size());
  merged.insert(merged.end(), candles_.begin(), candles_.end());
  merged.insert(merged.end(), candles.begin(), candles.end());
  std::stable_sort(merged.begin(), merged.end(), byTimestamp);
  merged.erase(std::unique(merged.begin(), merged.end(),
                           [](const OhlcCandle& a, const OhlcCandle& b) {
                             return a.timestamp == b.timestamp;
                           }),
               merged.end());

  std::size_t added = merged.size() - before;
  if (added == 0) return;

  candles_.swap(merged);
  emit(ChangeKind::Prepend, added);
}

void TimeSeriesStore::reset(const std::vector<OhlcCandle>& candles) {
  candles_ = candles;
  std::stable_sort(candles_.begin(), candles_.end(), byTimestamp);

  // Keep the last occurrence of each timestamp.
  std::vector<OhlcCandle> unique;
  unique.reserve(candles_.size());
  for (const auto& c : candles_) {
    if (!unique.empty() && unique.back().timestamp == c.timestamp) {
      unique.back() = c;
    } else {
      unique.push_back(c);
    }
  }
  candles_.swap(unique);
  emit(ChangeKind::Reset, candles_.size());
}

void TimeSeriesStore::emit(ChangeKind kind, std::size_t count) {
  ++revision_;
  if (onChange_) onChange_(StoreChange{kind, count});
}

} // namespace oc
