// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for lendswap::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO semantics and size bookkeeping
//   - Non-blocking try_pop() on empty and non-empty queues
//   - Move-only and variant payloads (the telemetry queue carries Events)
//   - Thread-safety under concurrent multi-producer / multi-consumer load
//
// Threading model:
//   The concurrent test joins every thread before asserting, so a failure
//   never leaves threads behind.
// =============================================================================

#include "lendswap/concurrent/thread_safe_queue.hpp"
#include "lendswap/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  lendswap::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty and try_pop() returns nullopt immediately.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 2. Items come back in the order they were pushed.
// Why: Telemetry subscribers must see a position's updates in order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), static_cast<std::size_t>(kCount));

  for (int i = 0; i < kCount; ++i) {
    const std::optional<int> item = queue.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. Move-only payloads pass through.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueuePayloadTest, MoveOnlyValues) {
  lendswap::ThreadSafeQueue<std::unique_ptr<int>> queue;
  queue.push(std::make_unique<int>(7));

  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, 7);
}

// -----------------------------------------------------------------------------
// 4. Event variants keep their alternative through the queue.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueuePayloadTest, EventVariants) {
  lendswap::ThreadSafeQueue<lendswap::Event> queue;

  lendswap::ReserveUpdateEvent reserve_update;
  reserve_update.operation = "withdraw";
  queue.push(reserve_update);

  lendswap::OperationRejectedEvent rejected;
  rejected.operation = "liquidate";
  queue.push(rejected);

  auto first = queue.try_pop();
  auto second = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  const auto* update = std::get_if<lendswap::ReserveUpdateEvent>(&*first);
  ASSERT_NE(update, nullptr);
  EXPECT_EQ(update->operation, "withdraw");
  EXPECT_TRUE(std::holds_alternative<lendswap::OperationRejectedEvent>(*second));
}

// -----------------------------------------------------------------------------
// 5. Concurrent multi-producer, multi-consumer stress test.
// How: 4 producers push disjoint ranges; 4 consumers drain with try_pop()
//      until every item is accounted for. Each value must appear once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        std::optional<int> item = queue.try_pop();
        if (item) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
