#pragma once

#include "pmm/concurrent/thread_safe_queue.hpp"
#include "pmm/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace pmm {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving a REP socket (operator commands) and a
//         PUB socket (JSON telemetry for every order, PnL and strategy
//         state change).
//
// @details
// Sockets:
//
//   1. PUB (default tcp://127.0.0.1:5557):
//      One JSON object per message, discriminated by "type":
//        order_update    order id, instrument, side, price, size, status,
//                        previous_status, timestamp_ms
//        pnl_snapshot    timestamp_ms, realized_pnl, rewards, total_pnl,
//                        buy_volume, sell_volume, confirmed_trades,
//                        history_size
//        strategy_state  instrument, state, previous_state, timestamp_ms
//      Events are handed over through a ThreadSafeQueue so that strategy
//      threads never wait on serialization or socket I/O.
//
//   2. REP (default tcp://127.0.0.1:5556):
//      Each request string is passed to the CommandHandler (bound to
//      MarketMakingEngine::executeCommand) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps the worker alternating between the two sockets.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The CommandHandler runs on the IPC worker thread.
//
// Ownership:
//   Owned by MarketMakingEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op if already running.
  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Drains remaining telemetry, then joins the worker. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  // JSON text for a telemetry event.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatOrderUpdate(const OrderUpdateEvent& e);
  static std::string formatPnlSnapshot(const PnlSnapshotEvent& e);
  static std::string formatStrategyState(const StrategyStateEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace pmm
