#pragma once
#include "oc/layout/MainPane.hpp"
#include "oc/layout/SubPane.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace oc {

// Per-pane merged updates, keyed "main" and "subpane-<i>". Panes with
// nothing to report are absent.
using PaneUpdates = std::map<std::string, ScaleDomainUpdate>;

class PaneManager {
public:
  explicit PaneManager(std::unique_ptr<MainPane> mainPane);

  MainPane& mainPane() { return *main_; }
  const MainPane& mainPane() const { return *main_; }

  // Throws std::invalid_argument on null or a duplicate id.
  SubPane& addSubPane(std::unique_ptr<SubPane> pane);
  bool removeSubPane(const std::string& id);
  SubPane* findSubPane(const std::string& id) const;
  const std::vector<std::unique_ptr<SubPane>>& subPanes() const { return subs_; }

  PaneUpdates updateLastCandle(const std::vector<OhlcCandle>& candles);
  PaneUpdates appendNewCandle(const std::vector<OhlcCandle>& candles);
  PaneUpdates prependHistoricalCandles(const std::vector<OhlcCandle>& candles);
  PaneUpdates resetCandles(const std::vector<OhlcCandle>& candles);

  void updateScales(bool timeChanged, bool priceChanged);
  void applyTheme(const Theme& theme);

  std::vector<Study*> allStudies() const;
  Study* findStudy(const std::string& id) const;

private:
  template <typename Fn>
  PaneUpdates collect(Fn fn);

  std::unique_ptr<MainPane> main_;
  std::vector<std::unique_ptr<SubPane>> subs_;
};

} // namespace oc
