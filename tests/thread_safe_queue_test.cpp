// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for trailguard::ThreadSafeQueue<T>, the queue behind every
// EventLoopThread and the IPC telemetry buffer.
//
// Validates:
//   - FIFO order, including for move-only payloads
//   - try_pop() and wait_pop() on empty queues
//   - A blocked pop() wakes on push from another thread
//   - Several price producers feeding one consumer lose nothing
// =============================================================================

#include "trailguard/concurrent/thread_safe_queue.hpp"
#include "trailguard/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  trailguard::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 1; i <= 5; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 5u);

  for (int i = 1; i <= 5; ++i) {
    EXPECT_EQ(queue.pop(), i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopOnEmptyAndNonEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(7);
  std::optional<int> value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 7);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 3. wait_pop() gives up after its timeout on an empty queue.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, WaitPopTimesOut) {
  const auto begin = std::chrono::steady_clock::now();
  std::optional<int> value = queue.wait_pop(std::chrono::milliseconds(20));
  const auto waited = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(value.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(15));
}

// -----------------------------------------------------------------------------
// 4. A consumer blocked in pop() is woken by a push from another thread.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWakesOnPush) {
  std::atomic<int> received{0};
  std::thread consumer([this, &received] { received = queue.pop(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.push(99);
  consumer.join();

  EXPECT_EQ(received.load(), 99);
}

// -----------------------------------------------------------------------------
// 5. Move-only payloads pass through unchanged.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnly, UniquePtrPayload) {
  trailguard::ThreadSafeQueue<std::unique_ptr<std::string>> queue;
  queue.push(std::make_unique<std::string>("RELIANCE"));

  std::unique_ptr<std::string> value = queue.pop();
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(*value, "RELIANCE");
}

// -----------------------------------------------------------------------------
// 6. Several producers pushing price events, one consumer draining them:
//    every observation arrives exactly once.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueConcurrency, ManyProducersOneConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;

  trailguard::ThreadSafeQueue<trailguard::Event> queue;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        trailguard::PriceObservationEvent e;
        e.ticker = "T" + std::to_string(p);
        e.price = 100.0 + i;
        e.timestamp_ms = p * kPerProducer + i;
        queue.push(e);
      }
    });
  }

  std::set<std::int64_t> seen;
  for (int n = 0; n < kProducers * kPerProducer; ++n) {
    trailguard::Event event = queue.pop();
    const auto* price = std::get_if<trailguard::PriceObservationEvent>(&event);
    ASSERT_NE(price, nullptr);
    seen.insert(price->timestamp_ms);
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(seen.size(), static_cast<std::size_t>(kProducers * kPerProducer));
  EXPECT_TRUE(queue.empty());
}
