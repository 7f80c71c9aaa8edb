#pragma once

#include "trailguard/domain/position.hpp"

#include <cstdint>
#include <string>

namespace trailguard {
namespace domain {

// One daily OHLC bar, oldest first in any sequence.
struct Candle {
  std::int64_t timestamp_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

// -----------------------------------------------------------------------------
// BrokerHolding - one open holding as reported by the broker
// -----------------------------------------------------------------------------
// quantity already includes settled and T+1 shares. Entries from the orders
// file are converted into this shape too, with source = OrdersFile.
// -----------------------------------------------------------------------------
struct BrokerHolding {
  std::string ticker;
  std::string exchange{"NSE"};
  std::string product{"CNC"};
  PositionSide side{PositionSide::Long};
  std::int64_t quantity{0};
  double average_price{0.0};
  double investment_amount{0.0};
  std::int64_t instrument_token{0};
  PositionSource source{PositionSource::BrokerHolding};
};

// Resolved instrument metadata. tick_size of 0 means the broker did not say.
struct Instrument {
  std::string ticker;
  std::string exchange{"NSE"};
  std::int64_t token{0};
  double tick_size{0.0};
};

// A standing broker-side conditional (GTT) order.
struct ConditionalOrder {
  std::string id;
  std::string ticker;
  std::string status;
};

}  // namespace domain
}  // namespace trailguard
