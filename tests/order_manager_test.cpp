// =============================================================================
// order_manager_test.cpp
// =============================================================================
// Unit tests for pmm::OrderManager.
//
// Validates:
//   - Placement clamps price into [0.01, 0.99] and size up to the minimum
//     (negative, > 1 and NaN inputs included) before anything is submitted
//   - Failed submissions and minimum-size lookups surface as Errors and
//     leave the registry untouched
//   - Cancel: confirmed → Canceled; unconfirmed → Unknown; throw → Unknown
//   - Reconcile: Unknown resolved to Live or Canceled from the open-order list
//   - Lifecycle graph and event publication
//   - Terminal-order retention limit
//   - Concurrent placement for different instruments
// =============================================================================

#include "pmm/eventbus/event_bus.hpp"
#include "pmm/exchange/paper_exchange.hpp"
#include "pmm/orders/order_manager.hpp"
#include "pmm/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <thread>
#include <vector>

class OrderManagerTest : public ::testing::Test {
 protected:
  pmm::SimulationTimeProvider clock{5000};
  pmm::PaperExchange exchange{clock, "0xpaper", 5.0};
  pmm::EventBus bus;
  pmm::OrderManager manager{exchange, clock, &bus};
  const pmm::domain::Instrument instrument{"cond-1", "token-yes"};

  std::vector<pmm::OrderUpdateEvent> updates;

  void SetUp() override {
    bus.subscribe<pmm::OrderUpdateEvent>(
        [this](const pmm::OrderUpdateEvent& e) { updates.push_back(e); });
  }

  pmm::domain::OrderId placeLive(pmm::domain::Side side, double price) {
    auto id = manager.place(instrument, side, 10, price);
    EXPECT_TRUE(id.ok());
    return id.value();
  }
};

// -----------------------------------------------------------------------------
// 1. Successful placement records a Live order and publishes it.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, PlaceRecordsLiveOrder) {
  auto result = manager.place(instrument, pmm::domain::Side::Buy, 20, 0.47, 15);
  ASSERT_TRUE(result.ok());

  auto order = manager.order(result.value());
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, pmm::domain::OrderStatus::Live);
  EXPECT_EQ(order->instrument, instrument);
  EXPECT_DOUBLE_EQ(order->price, 0.47);
  EXPECT_DOUBLE_EQ(order->size, 20.0);
  EXPECT_EQ(order->placed_at_ms, 5000);

  ASSERT_EQ(exchange.submissions().size(), 1u);
  EXPECT_EQ(exchange.submissions()[0].fee_rate_bps, 15);

  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].order.status, pmm::domain::OrderStatus::Live);
  EXPECT_EQ(updates[0].previous_status, pmm::domain::OrderStatus::Pending);
  EXPECT_EQ(manager.liveCount(instrument), 1u);
}

// -----------------------------------------------------------------------------
// 2. Price clamping: nothing outside [0.01, 0.99] ever reaches the exchange.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, PriceIsClampedBeforeSubmission) {
  const double inputs[] = {-0.2, 0.0, 0.004, 0.5, 0.995, 1.0, 1.7,
                           std::numeric_limits<double>::quiet_NaN(),
                           std::numeric_limits<double>::infinity(),
                           -std::numeric_limits<double>::infinity()};
  for (double price : inputs) {
    auto result = manager.place(instrument, pmm::domain::Side::Sell, 10, price);
    EXPECT_TRUE(result.ok()) << "price input " << price;
  }

  for (const auto& spec : exchange.submissions()) {
    EXPECT_GE(spec.price, 0.01);
    EXPECT_LE(spec.price, 0.99);
  }

  auto specs = exchange.submissions();
  EXPECT_DOUBLE_EQ(specs[0].price, 0.01);   // negative
  EXPECT_DOUBLE_EQ(specs[3].price, 0.5);    // in range, untouched
  EXPECT_DOUBLE_EQ(specs[6].price, 0.99);   // > 1
  EXPECT_DOUBLE_EQ(specs[7].price, 0.01);   // NaN
  EXPECT_DOUBLE_EQ(specs[8].price, 0.99);   // +inf
}

// -----------------------------------------------------------------------------
// 3. Size is raised to the market minimum; unusable sizes become the minimum.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, SizeIsRaisedToMinimum) {
  exchange.setMinOrderSize("cond-1", 25);

  const double sizes[] = {1.0, 0.0, -3.0,
                          std::numeric_limits<double>::quiet_NaN(), 40.0};
  for (double size : sizes) {
    ASSERT_TRUE(manager.place(instrument, pmm::domain::Side::Buy, size, 0.3)
                    .ok());
  }

  auto specs = exchange.submissions();
  ASSERT_EQ(specs.size(), 5u);
  for (std::size_t i = 0; i < 4; ++i) {
    EXPECT_DOUBLE_EQ(specs[i].size, 25.0) << "index " << i;
  }
  EXPECT_DOUBLE_EQ(specs[4].size, 40.0);
}

// -----------------------------------------------------------------------------
// 4. Minimum-size lookup failure: Error, nothing submitted, nothing recorded.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, MinSizeLookupFailureSubmitsNothing) {
  exchange.failNext(pmm::PaperExchange::Operation::MinOrderSize);

  auto result = manager.place(instrument, pmm::domain::Side::Buy, 10, 0.4);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, pmm::ErrorKind::External);
  EXPECT_TRUE(exchange.submissions().empty());
  EXPECT_TRUE(manager.orders(instrument).empty());
}

// -----------------------------------------------------------------------------
// 5. Rejected submission: Error, Failed event, registry untouched.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, SubmissionFailureIsReported) {
  exchange.failNext(pmm::PaperExchange::Operation::SubmitOrder, 1,
                    "insufficient balance");

  auto result = manager.place(instrument, pmm::domain::Side::Buy, 10, 0.4);
  ASSERT_FALSE(result.ok());
  EXPECT_NE(result.error().message.find("insufficient balance"),
            std::string::npos);
  EXPECT_EQ(manager.liveCount(instrument), 0u);
  EXPECT_TRUE(manager.orders(instrument).empty());

  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].order.status, pmm::domain::OrderStatus::Failed);
}

// -----------------------------------------------------------------------------
// 6. Confirmed cancel.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, ConfirmedCancelMarksCanceled) {
  auto id = placeLive(pmm::domain::Side::Buy, 0.4);

  auto outcome = manager.cancel(id);
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value(), pmm::CancelOutcome::Confirmed);
  EXPECT_EQ(manager.order(id)->status, pmm::domain::OrderStatus::Canceled);
  EXPECT_EQ(manager.liveCount(instrument), 0u);
  EXPECT_FALSE(exchange.isResting(id));

  // Terminal orders cannot be canceled again.
  auto again = manager.cancel(id);
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error().kind, pmm::ErrorKind::InvalidArgument);
}

// -----------------------------------------------------------------------------
// 7. Unconfirmed cancel: Unknown, still counted as possibly resting.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, UnconfirmedCancelMarksUnknown) {
  auto id = placeLive(pmm::domain::Side::Sell, 0.6);
  exchange.refuseNextCancels(1);

  auto outcome = manager.cancel(id);
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value(), pmm::CancelOutcome::Unconfirmed);
  EXPECT_EQ(manager.order(id)->status, pmm::domain::OrderStatus::Unknown);
  EXPECT_EQ(manager.liveCount(instrument), 1u);
  EXPECT_EQ(manager.liveCount(instrument, pmm::domain::Side::Sell), 1u);
  EXPECT_EQ(manager.liveCount(instrument, pmm::domain::Side::Buy), 0u);
}

// -----------------------------------------------------------------------------
// 8. Cancel call that throws: External error, order Unknown.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, CancelFailureMarksUnknown) {
  auto id = placeLive(pmm::domain::Side::Buy, 0.4);
  exchange.failNext(pmm::PaperExchange::Operation::CancelOrder);

  auto outcome = manager.cancel(id);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error().kind, pmm::ErrorKind::External);
  EXPECT_EQ(manager.order(id)->status, pmm::domain::OrderStatus::Unknown);
}

// -----------------------------------------------------------------------------
// 9. Unknown ids are NotFound and do not reach the exchange.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, CancelUnknownIdIsNotFound) {
  auto outcome = manager.cancel("0xdeadbeef");
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error().kind, pmm::ErrorKind::NotFound);
  EXPECT_EQ(exchange.cancelRequests(), 0u);
}

// -----------------------------------------------------------------------------
// 10. Reconcile: still resting → Live; gone → Canceled.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, ReconcileResolvesUnknownOrders) {
  auto resting = placeLive(pmm::domain::Side::Buy, 0.4);
  auto gone = placeLive(pmm::domain::Side::Sell, 0.6);

  exchange.refuseNextCancels(1);
  ASSERT_TRUE(manager.cancel(resting).ok());  // refused: stays on the book
  exchange.failNext(pmm::PaperExchange::Operation::CancelOrder);
  ASSERT_FALSE(manager.cancel(gone).ok());    // thrown: status unknown
  ASSERT_TRUE(exchange.fillOrder(gone, 10));  // ...and it was in fact filled

  auto resolved = manager.reconcile(instrument);
  ASSERT_TRUE(resolved.ok());
  EXPECT_EQ(resolved.value(), 2u);
  EXPECT_EQ(manager.order(resting)->status, pmm::domain::OrderStatus::Live);
  EXPECT_EQ(manager.order(gone)->status, pmm::domain::OrderStatus::Canceled);

  // Nothing Unknown left: no exchange poll.
  exchange.failNext(pmm::PaperExchange::Operation::ListOpenOrders);
  auto idle = manager.reconcile(instrument);
  ASSERT_TRUE(idle.ok());
  EXPECT_EQ(idle.value(), 0u);
}

// -----------------------------------------------------------------------------
// 11. Reconcile poll failure keeps Unknown orders Unknown.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, ReconcilePollFailureKeepsUnknown) {
  auto id = placeLive(pmm::domain::Side::Buy, 0.4);
  exchange.refuseNextCancels(1);
  ASSERT_TRUE(manager.cancel(id).ok());

  exchange.failNext(pmm::PaperExchange::Operation::ListOpenOrders);
  auto resolved = manager.reconcile(instrument);
  ASSERT_FALSE(resolved.ok());
  EXPECT_EQ(manager.order(id)->status, pmm::domain::OrderStatus::Unknown);
}

// -----------------------------------------------------------------------------
// 11b. Only the most recent terminal orders are retained; orders that may
//      still rest are never dropped.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, OldTerminalOrdersAreForgotten) {
  pmm::OrderManager bounded{exchange, clock, nullptr, 2};

  std::vector<pmm::domain::OrderId> ids;
  for (int i = 0; i < 5; ++i) {
    auto id = bounded.place(instrument, pmm::domain::Side::Buy, 10, 0.40);
    ASSERT_TRUE(id.ok());
    ids.push_back(id.value());
  }
  for (int i = 0; i < 4; ++i) {
    auto outcome = bounded.cancel(ids[i]);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value(), pmm::CancelOutcome::Confirmed);
  }

  auto kept = bounded.orders(instrument);
  ASSERT_EQ(kept.size(), 3u);
  EXPECT_EQ(kept[0].id, ids[2]);
  EXPECT_EQ(kept[1].id, ids[3]);
  EXPECT_EQ(kept[2].id, ids[4]);

  EXPECT_FALSE(bounded.order(ids[0]).has_value());
  auto forgotten = bounded.cancel(ids[1]);
  ASSERT_FALSE(forgotten.ok());
  EXPECT_EQ(forgotten.error().kind, pmm::ErrorKind::NotFound);

  exchange.refuseNextCancels(1);
  auto refused = bounded.cancel(ids[4]);
  ASSERT_TRUE(refused.ok());
  EXPECT_EQ(refused.value(), pmm::CancelOutcome::Unconfirmed);
  EXPECT_EQ(bounded.liveCount(instrument), 1u);
  ASSERT_TRUE(bounded.order(ids[4]).has_value());
  EXPECT_EQ(bounded.order(ids[4])->status, pmm::domain::OrderStatus::Unknown);
}

// -----------------------------------------------------------------------------
// 12. Lifecycle graph.
// -----------------------------------------------------------------------------
TEST(OrderLifecycleTest, LegalTransitions) {
  using S = pmm::domain::OrderStatus;
  using pmm::OrderManager;

  EXPECT_TRUE(OrderManager::isLegalTransition(S::Pending, S::Live));
  EXPECT_TRUE(OrderManager::isLegalTransition(S::Pending, S::Failed));
  EXPECT_TRUE(OrderManager::isLegalTransition(S::Live, S::Canceled));
  EXPECT_TRUE(OrderManager::isLegalTransition(S::Live, S::Unknown));
  EXPECT_TRUE(OrderManager::isLegalTransition(S::Unknown, S::Live));
  EXPECT_TRUE(OrderManager::isLegalTransition(S::Unknown, S::Canceled));

  EXPECT_FALSE(OrderManager::isLegalTransition(S::Pending, S::Canceled));
  EXPECT_FALSE(OrderManager::isLegalTransition(S::Canceled, S::Live));
  EXPECT_FALSE(OrderManager::isLegalTransition(S::Failed, S::Live));
  EXPECT_FALSE(OrderManager::isLegalTransition(S::Canceled, S::Unknown));

  EXPECT_TRUE(OrderManager::isTerminal(S::Canceled));
  EXPECT_TRUE(OrderManager::isTerminal(S::Failed));
  EXPECT_FALSE(OrderManager::isTerminal(S::Unknown));
}

// -----------------------------------------------------------------------------
// 13. Strategy threads for different instruments place concurrently.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, ConcurrentPlacementAcrossInstruments) {
  constexpr int kInstruments = 4;
  constexpr int kOrdersEach = 50;

  // No bus: the fixture's update collector is single-threaded.
  pmm::OrderManager shared{exchange, clock};

  std::vector<std::thread> threads;
  for (int i = 0; i < kInstruments; ++i) {
    threads.emplace_back([&shared, i] {
      pmm::domain::Instrument instr{"cond-" + std::to_string(i), "tok"};
      for (int n = 0; n < kOrdersEach; ++n) {
        auto id = shared.place(instr, pmm::domain::Side::Buy, 10, 0.3);
        if (id.ok() && n % 2 == 0) {
          auto outcome = shared.cancel(id.value());
          EXPECT_TRUE(outcome.ok());
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < kInstruments; ++i) {
    pmm::domain::Instrument instr{"cond-" + std::to_string(i), "tok"};
    EXPECT_EQ(shared.orders(instr).size(),
              static_cast<std::size_t>(kOrdersEach));
    EXPECT_EQ(shared.liveCount(instr),
              static_cast<std::size_t>(kOrdersEach / 2));
    EXPECT_EQ(exchange.ownRestingCount(instr),
              static_cast<std::size_t>(kOrdersEach / 2));
  }
}
