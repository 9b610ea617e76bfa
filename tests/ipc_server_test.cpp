// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Tests for pmm::IpcServer.
//
// Validates:
//   - Telemetry JSON for each event type (parsed back with nlohmann)
//   - REQ/REP command round trip through the CommandHandler, including a
//     handler that throws
//   - Pushed telemetry reaches a SUB socket
//   - start()/stop() idempotence
//
// Socket tests bind ipc:// endpoints under the test temp directory so they
// never collide with a running engine's tcp ports.
// =============================================================================

#include "pmm/network/ipc_server.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <stdexcept>
#include <string>

using nlohmann::json;

namespace {

std::string endpoint(const std::string& name) {
  return "ipc://" + ::testing::TempDir() + "pmm_" + name + "_" +
         std::to_string(::getpid());
}

pmm::domain::Order sampleOrder() {
  pmm::domain::Order order;
  order.id = "0x00000000000000ab";
  order.instrument = {"cond-1", "token-yes"};
  order.side = pmm::domain::Side::Sell;
  order.size = 50;
  order.price = 0.53;
  order.status = pmm::domain::OrderStatus::Canceled;
  return order;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. order_update
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, OrderUpdate) {
  pmm::OrderUpdateEvent event;
  event.order = sampleOrder();
  event.previous_status = pmm::domain::OrderStatus::Live;
  event.timestamp_ms = 1700000000000;

  auto j = json::parse(pmm::IpcServer::formatTelemetry(event));
  EXPECT_EQ(j["type"], "order_update");
  EXPECT_EQ(j["order_id"], "0x00000000000000ab");
  EXPECT_EQ(j["market_id"], "cond-1");
  EXPECT_EQ(j["token_id"], "token-yes");
  EXPECT_EQ(j["side"], "SELL");
  EXPECT_DOUBLE_EQ(j["price"].get<double>(), 0.53);
  EXPECT_DOUBLE_EQ(j["size"].get<double>(), 50.0);
  EXPECT_EQ(j["status"], "Canceled");
  EXPECT_EQ(j["previous_status"], "Live");
  EXPECT_EQ(j["timestamp_ms"].get<std::int64_t>(), 1700000000000);
}

// -----------------------------------------------------------------------------
// 2. pnl_snapshot
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, PnlSnapshot) {
  pmm::PnlSnapshotEvent event;
  event.snapshot.timestamp_ms = 42;
  event.snapshot.realized_pnl = -1.0;
  event.snapshot.rewards = 0.5;
  event.snapshot.total_pnl = -0.5;
  event.snapshot.buy_volume = 10;
  event.snapshot.sell_volume = 10;
  event.snapshot.confirmed_trades = 2;
  event.history_size = 7;

  auto j = json::parse(pmm::IpcServer::formatTelemetry(event));
  EXPECT_EQ(j["type"], "pnl_snapshot");
  EXPECT_EQ(j["timestamp_ms"].get<std::int64_t>(), 42);
  EXPECT_DOUBLE_EQ(j["realized_pnl"].get<double>(), -1.0);
  EXPECT_DOUBLE_EQ(j["rewards"].get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(j["total_pnl"].get<double>(), -0.5);
  EXPECT_EQ(j["confirmed_trades"].get<std::size_t>(), 2u);
  EXPECT_EQ(j["history_size"].get<std::size_t>(), 7u);
}

// -----------------------------------------------------------------------------
// 3. strategy_state
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, StrategyState) {
  pmm::StrategyStateEvent event;
  event.instrument = {"cond-2", "token-no"};
  event.state = pmm::domain::StrategyState::WindingDown;
  event.previous_state = pmm::domain::StrategyState::Running;
  event.timestamp_ms = 99;

  auto j = json::parse(pmm::IpcServer::formatTelemetry(event));
  EXPECT_EQ(j["type"], "strategy_state");
  EXPECT_EQ(j["market_id"], "cond-2");
  EXPECT_EQ(j["token_id"], "token-no");
  EXPECT_EQ(j["state"], "WindingDown");
  EXPECT_EQ(j["previous_state"], "Running");
}

// -----------------------------------------------------------------------------
// 4. Command round trip over REQ/REP.
// -----------------------------------------------------------------------------
TEST(IpcServerSocketTest, CommandRoundTrip) {
  const auto cmd = endpoint("cmd_rt");
  const auto pub = endpoint("pub_rt");
  pmm::IpcServer server(
      [](const std::string& request) {
        if (request == "BOOM") {
          throw std::runtime_error("handler exploded");
        }
        return json{{"status", "ok"}, {"echo", request}}.dump();
      },
      cmd, pub);
  server.start();
  ASSERT_TRUE(server.running());

  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(cmd);

  const std::string ping = "PING";
  req.send(zmq::buffer(ping), zmq::send_flags::none);

  zmq::message_t reply;
  auto received = req.recv(reply, zmq::recv_flags::none);
  ASSERT_TRUE(received.has_value());

  auto j = json::parse(reply.to_string());
  EXPECT_EQ(j["status"], "ok");
  EXPECT_EQ(j["echo"], "PING");

  // A throwing handler still gets a reply; the socket stays usable.
  const std::string boom = "BOOM";
  req.send(zmq::buffer(boom), zmq::send_flags::none);
  ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value());
  auto error = json::parse(reply.to_string());
  EXPECT_EQ(error["status"], "error");
  EXPECT_EQ(error["response"], "handler exploded");

  req.send(zmq::buffer(ping), zmq::send_flags::none);
  ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value());
  EXPECT_EQ(json::parse(reply.to_string())["echo"], "PING");

  server.stop();
  EXPECT_FALSE(server.running());
  server.stop();  // idempotent
}

// -----------------------------------------------------------------------------
// 5. Telemetry reaches a subscriber. PUB/SUB drops messages until the
//    subscription propagates, so keep publishing until one arrives.
// -----------------------------------------------------------------------------
TEST(IpcServerSocketTest, TelemetryPublished) {
  const auto cmd = endpoint("cmd_pub");
  const auto pub = endpoint("pub_pub");
  pmm::IpcServer server([](const std::string&) { return std::string("{}"); },
                        cmd, pub);
  server.start();
  server.start();  // no-op

  zmq::context_t ctx(1);
  zmq::socket_t sub(ctx, zmq::socket_type::sub);
  sub.set(zmq::sockopt::subscribe, "");
  sub.set(zmq::sockopt::rcvtimeo, 100);
  sub.set(zmq::sockopt::linger, 0);
  sub.connect(pub);

  pmm::StrategyStateEvent event;
  event.instrument = {"cond-1", "token-yes"};
  event.state = pmm::domain::StrategyState::Running;

  std::string payload;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (payload.empty() && std::chrono::steady_clock::now() < deadline) {
    server.pushTelemetry(event);
    zmq::message_t msg;
    if (sub.recv(msg, zmq::recv_flags::none)) {
      payload = msg.to_string();
    }
  }

  ASSERT_FALSE(payload.empty());
  auto j = json::parse(payload);
  EXPECT_EQ(j["type"], "strategy_state");
  EXPECT_EQ(j["state"], "Running");
  server.stop();
}
