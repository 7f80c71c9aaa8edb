#pragma once

#include "trailguard/domain/market_data.hpp"

#include <string>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// loadOrdersFile(path)
// -----------------------------------------------------------------------------
//
// @brief  Reads entry orders written by the order placement tooling and
//         returns them as LONG holdings with source = OrdersFile.
//
// @details
// Expected shape: {"orders": [ ... ]}. Two entry formats are accepted:
//
//   placed order   {"order_success": true, "ticker": "X", "position_size": 10,
//                   "current_price": 101.5, "investment_amount": 1015.0,
//                   "order_timestamp": "..."}
//   synced fill    {"data_source": "server_sync", "status": "COMPLETE",
//                   "transaction_type": "BUY", "tradingsymbol": "X",
//                   "filled_quantity": 10, "average_price": 101.5}
//
// Anything else is skipped. When a ticker appears more than once only the
// first entry is kept.
//
// Throws ConfigError if the file cannot be opened or parsed.
// -----------------------------------------------------------------------------
std::vector<domain::BrokerHolding> loadOrdersFile(const std::string& path);

// Parses the same structure from an in-memory JSON document.
std::vector<domain::BrokerHolding> parseOrdersDocument(const std::string& text);

}  // namespace trailguard
