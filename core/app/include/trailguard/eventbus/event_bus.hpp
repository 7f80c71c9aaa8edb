#pragma once

#include "trailguard/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace trailguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe channel for Event values.
// Each EventLoopThread owns one; components subscribe to the bus of the loop
// they live on, so their callbacks run on that loop's thread.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run on the thread that calls publish(), after the subscriber
// list has been copied, so a callback may itself publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event. Returns an id for unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only sees events holding EventType. Other
  // alternatives of the variant are filtered out by std::get_if.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish already in progress may still call it
  // once for the current event.
  void unsubscribe(SubscriptionId id);

  // Delivers the event to every subscriber, on the calling thread.
  void publish(const Event& event);

  // Number of live subscriptions (diagnostics and tests).
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;   // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace trailguard
