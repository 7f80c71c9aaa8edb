#include "trailguard/risk/tick_size_table.hpp"

#include <cmath>
#include <utility>

namespace trailguard {

namespace {

std::unordered_map<std::string, double> defaultOverrides() {
  return {{"AIAENG", 0.10}, {"CREDITACC", 0.10}};
}

}  // namespace

TickSizeTable::TickSizeTable() : overrides_(defaultOverrides()) {}

TickSizeTable::TickSizeTable(std::unordered_map<std::string, double> overrides)
    : overrides_(defaultOverrides()) {
  for (auto& [ticker, tick] : overrides) {
    overrides_[ticker] = tick;
  }
}

double TickSizeTable::tickFor(const std::string& ticker, double price,
                              double instrument_tick) const {
  if (instrument_tick > 0.0) {
    return instrument_tick;
  }
  auto it = overrides_.find(ticker);
  if (it != overrides_.end() && it->second > 0.0) {
    return it->second;
  }
  return bandTick(price);
}

double TickSizeTable::bandTick(double price) {
  if (price < 50.0) {
    return 0.01;
  }
  if (price < 500.0) {
    return 0.05;
  }
  if (price < 1000.0) {
    return 0.10;
  }
  if (price < 5000.0) {
    return 0.25;
  }
  if (price < 10000.0) {
    return 0.50;
  }
  return 1.00;
}

double TickSizeTable::roundToTick(double price, double tick) {
  if (tick <= 0.0) {
    return price;
  }
  const double rounded = std::round(price / tick) * tick;
  // Trim binary noise such as 94.50000000000001.
  return std::round(rounded * 1e8) / 1e8;
}

}  // namespace trailguard
