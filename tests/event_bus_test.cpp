// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for trailguard::EventBus.
//
// Validates:
//   - Generic subscribers see every event type
//   - Typed subscribers only see their own type, with the payload intact
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback (the PositionMonitor
//     publishes StopUpdateEvent and OrderRequestEvent while handling a
//     price) without deadlocking
//
// Single-threaded. Cross-thread delivery is covered by the monitor engine
// tests.
// =============================================================================

#include "trailguard/eventbus/event_bus.hpp"
#include "trailguard/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  trailguard::EventBus bus;

  static trailguard::PriceObservationEvent price(const std::string& ticker,
                                                 double value) {
    trailguard::PriceObservationEvent e;
    e.ticker = ticker;
    e.price = value;
    e.timestamp_ms = 1;
    return e;
  }

  static trailguard::OrderRequestEvent request(const std::string& ticker,
                                               std::int64_t quantity) {
    trailguard::OrderRequestEvent e;
    e.request.ticker = ticker;
    e.request.quantity = quantity;
    e.request.tranche_id = trailguard::domain::kStopLossTranche;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is called for every alternative of the variant.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const trailguard::Event&) { ++calls; });

  bus.publish(price("INFY", 1500.0));
  bus.publish(request("INFY", 4));
  bus.publish(trailguard::StopUpdateEvent{});
  bus.publish(trailguard::ReconcileEvent{});

  EXPECT_EQ(calls, 4);
}

// -----------------------------------------------------------------------------
// 2. subscribe<T> filters other types and delivers the payload unchanged.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersAndKeepsPayload) {
  std::vector<trailguard::PriceObservationEvent> prices;
  bus.subscribe<trailguard::PriceObservationEvent>(
      [&prices](const trailguard::PriceObservationEvent& e) {
        prices.push_back(e);
      });

  bus.publish(request("TCS", 10));
  bus.publish(price("TCS", 3456.75));
  bus.publish(trailguard::VolatilityUpdateEvent{});

  ASSERT_EQ(prices.size(), 1u);
  EXPECT_EQ(prices[0].ticker, "TCS");
  EXPECT_DOUBLE_EQ(prices[0].price, 3456.75);
}

// -----------------------------------------------------------------------------
// 3. Every subscriber of a type receives the same event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe<trailguard::OrderRequestEvent>(
      [&a](const trailguard::OrderRequestEvent&) { ++a; });
  bus.subscribe<trailguard::OrderRequestEvent>(
      [&b](const trailguard::OrderRequestEvent&) { ++b; });

  bus.publish(request("SBIN", 1));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe() the callback is not called again.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  const auto id = bus.subscribe<trailguard::PriceObservationEvent>(
      [&calls](const trailguard::PriceObservationEvent&) { ++calls; });

  bus.publish(price("INFY", 1.0));
  bus.unsubscribe(id);
  bus.publish(price("INFY", 2.0));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  bus.subscribe([](const trailguard::Event&) {});
  bus.unsubscribe(12345);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(price("INFY", 1.0)));
}

// -----------------------------------------------------------------------------
// 5. Publishing from inside a callback does not deadlock and the nested
//    event reaches its subscribers.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<std::string> exits;
  bus.subscribe<trailguard::OrderRequestEvent>(
      [&exits](const trailguard::OrderRequestEvent& e) {
        exits.push_back(e.request.ticker);
      });
  bus.subscribe<trailguard::PriceObservationEvent>(
      [this](const trailguard::PriceObservationEvent& e) {
        if (e.price < 100.0) {
          bus.publish(request(e.ticker, 5));
        }
      });

  bus.publish(price("WIPRO", 120.0));
  bus.publish(price("WIPRO", 95.0));

  ASSERT_EQ(exits.size(), 1u);
  EXPECT_EQ(exits[0], "WIPRO");
}
