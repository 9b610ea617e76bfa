// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for pmm::EventBus.
//
// Validates:
//   - Generic subscription sees order, PnL and strategy-state events
//   - Typed subscription filters on the variant alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish from inside a callback does not deadlock
//   - Concurrent publishers (one per strategy thread) lose nothing
// =============================================================================

#include "pmm/eventbus/event_bus.hpp"
#include "pmm/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  pmm::EventBus bus;

  static pmm::OrderUpdateEvent makeOrderUpdate(const std::string& id,
                                               pmm::domain::OrderStatus status) {
    pmm::OrderUpdateEvent e;
    e.order.id = id;
    e.order.instrument = {"m1", "t1"};
    e.order.side = pmm::domain::Side::Buy;
    e.order.price = 0.47;
    e.order.size = 50.0;
    e.order.status = status;
    e.previous_status = pmm::domain::OrderStatus::Pending;
    return e;
  }

  static pmm::StrategyStateEvent makeState(pmm::domain::StrategyState state) {
    pmm::StrategyStateEvent e;
    e.instrument = {"m1", "t1"};
    e.state = state;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. Generic subscriber receives every alternative of the Event variant.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const pmm::Event&) { ++call_count; });

  bus.publish(makeOrderUpdate("0x1", pmm::domain::OrderStatus::Live));
  bus.publish(pmm::PnlSnapshotEvent{});
  bus.publish(makeState(pmm::domain::StrategyState::Running));

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. Typed subscriber fires only for its own event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int state_count = 0;
  bus.subscribe<pmm::StrategyStateEvent>(
      [&state_count](const pmm::StrategyStateEvent&) { ++state_count; });

  bus.publish(makeOrderUpdate("0x1", pmm::domain::OrderStatus::Live));
  bus.publish(makeState(pmm::domain::StrategyState::Running));
  bus.publish(pmm::PnlSnapshotEvent{});

  EXPECT_EQ(state_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Payload fields arrive intact.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  pmm::OrderUpdateEvent received;
  bus.subscribe<pmm::OrderUpdateEvent>(
      [&received](const pmm::OrderUpdateEvent& e) { received = e; });

  bus.publish(makeOrderUpdate("0xabc", pmm::domain::OrderStatus::Canceled));

  EXPECT_EQ(received.order.id, "0xabc");
  EXPECT_EQ(received.order.instrument, (pmm::domain::Instrument{"m1", "t1"}));
  EXPECT_EQ(received.order.status, pmm::domain::OrderStatus::Canceled);
  EXPECT_DOUBLE_EQ(received.order.price, 0.47);
}

// -----------------------------------------------------------------------------
// 4. Unsubscribe stops delivery and shrinks the subscriber count.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<pmm::PnlSnapshotEvent>(
      [&call_count](const pmm::PnlSnapshotEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(pmm::PnlSnapshotEvent{});
  bus.unsubscribe(id);
  bus.publish(pmm::PnlSnapshotEvent{});

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishToEmptyBus) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(pmm::PnlSnapshotEvent{}));
}

// -----------------------------------------------------------------------------
// 6. A callback may publish on the same bus.
// Scenario: an order-update subscriber reacts by publishing a PnL snapshot.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int pnl_received = 0;
  bus.subscribe<pmm::PnlSnapshotEvent>(
      [&pnl_received](const pmm::PnlSnapshotEvent&) { ++pnl_received; });
  bus.subscribe<pmm::OrderUpdateEvent>(
      [this](const pmm::OrderUpdateEvent&) {
        bus.publish(pmm::PnlSnapshotEvent{});
      });

  bus.publish(makeOrderUpdate("0x1", pmm::domain::OrderStatus::Live));

  EXPECT_EQ(pnl_received, 1);
}

// -----------------------------------------------------------------------------
// 7. Several strategy threads publishing at once: every event delivered.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishersAllDelivered) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;

  std::atomic<int> delivered{0};
  bus.subscribe<pmm::OrderUpdateEvent>(
      [&delivered](const pmm::OrderUpdateEvent&) { ++delivered; });

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this, t] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.publish(makeOrderUpdate(std::to_string(t) + ":" + std::to_string(i),
                                    pmm::domain::OrderStatus::Live));
      }
    });
  }
  for (auto& p : publishers) p.join();

  EXPECT_EQ(delivered.load(), kThreads * kPerThread);
}
