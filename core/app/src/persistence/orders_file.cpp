#include "trailguard/persistence/orders_file.hpp"
#include "trailguard/errors/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace trailguard {

namespace {

bool isPlacedOrder(const nlohmann::json& order) {
  return order.value("order_success", false);
}

bool isSyncedBuy(const nlohmann::json& order) {
  return order.value("data_source", std::string()) == "server_sync" &&
         order.value("status", std::string()) == "COMPLETE" &&
         order.value("transaction_type", std::string()) == "BUY" &&
         order.value("filled_quantity", std::int64_t{0}) > 0;
}

domain::BrokerHolding toHolding(const nlohmann::json& order) {
  domain::BrokerHolding h;
  h.side = domain::PositionSide::Long;
  h.product = "CNC";
  h.source = domain::PositionSource::OrdersFile;
  h.exchange = order.value("exchange", std::string("NSE"));

  if (order.contains("ticker")) {
    h.ticker = order.at("ticker").get<std::string>();
    h.quantity = order.at("position_size").get<std::int64_t>();
    h.average_price = order.at("current_price").get<double>();
    h.investment_amount = order.value(
        "investment_amount", h.average_price * static_cast<double>(h.quantity));
  } else {
    h.ticker = order.at("tradingsymbol").get<std::string>();
    h.quantity = order.at("filled_quantity").get<std::int64_t>();
    h.average_price = order.at("average_price").get<double>();
    h.investment_amount = h.average_price * static_cast<double>(h.quantity);
  }
  return h;
}

}  // namespace

std::vector<domain::BrokerHolding> parseOrdersDocument(const std::string& text) {
  std::vector<domain::BrokerHolding> result;
  std::unordered_set<std::string> seen;

  try {
    const nlohmann::json root = nlohmann::json::parse(text);
    if (!root.is_object() || !root.contains("orders")) {
      return result;
    }

    for (const auto& order : root.at("orders")) {
      if (!isPlacedOrder(order) && !isSyncedBuy(order)) {
        continue;
      }
      domain::BrokerHolding h = toHolding(order);
      if (h.ticker.empty() || h.quantity <= 0) {
        continue;
      }
      if (!seen.insert(h.ticker).second) {
        continue;
      }
      result.push_back(std::move(h));
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed orders file: ") + e.what());
  }
  return result;
}

std::vector<domain::BrokerHolding> loadOrdersFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open orders file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto holdings = parseOrdersDocument(buffer.str());
  std::cout << "[OrdersFile] " << holdings.size()
            << " position(s) loaded from " << path << "\n";
  return holdings;
}

}  // namespace trailguard
