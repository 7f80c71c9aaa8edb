#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// IExclusionPolicy - tickers the monitor must leave alone
// -----------------------------------------------------------------------------
// Consulted by PositionLedger (never start tracking) and PriceFeed (never
// poll). Injected so deployments and tests can choose the list.
// -----------------------------------------------------------------------------
class IExclusionPolicy {
 public:
  virtual ~IExclusionPolicy() = default;

  virtual bool isExcluded(const std::string& ticker) const = 0;
};

// Fixed list, normally read from the "excluded_tickers" config key.
class StaticExclusionPolicy final : public IExclusionPolicy {
 public:
  StaticExclusionPolicy() = default;
  explicit StaticExclusionPolicy(const std::vector<std::string>& tickers)
      : tickers_(tickers.begin(), tickers.end()) {}

  bool isExcluded(const std::string& ticker) const override {
    return tickers_.count(ticker) > 0;
  }

  std::size_t size() const { return tickers_.size(); }

 private:
  std::unordered_set<std::string> tickers_;
};

}  // namespace trailguard
