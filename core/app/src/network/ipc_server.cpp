#include "pmm/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>

namespace pmm {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both endpoints, then spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto rep = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  rep->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  rep->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);

  // A bind failure throws here; the locals release whatever was opened.
  rep->bind(cmd_endpoint_);
  pub->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(rep);
  pub_socket_ = std::move(pub);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] Listening for commands on " << cmd_endpoint_
            << ", publishing telemetry on " << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): the worker publishes what is queued, then the sockets close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
  std::cout << "[IpcServer] Stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): worker thread body
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  for (const auto& event : telemetry_queue_.drain()) {
    const std::string text = formatTelemetry(event);
    pub_socket_->send(zmq::buffer(text), zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): at most one request per call
// -----------------------------------------------------------------------------
// REP requires exactly one reply per request, so a handler failure is
// answered with an error object rather than left pending.
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[IpcServer] ERROR: command receive failed: " << e.what()
                << "\n";
    }
    return;
  }
  if (!received) {
    return;  // rcvtimeo expired
  }

  const std::string command = request.to_string();
  std::string reply;
  try {
    reply = command_handler_(command);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command '" << command
              << "' failed: " << e.what() << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = e.what();
    reply = error.dump();
  }

  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// Telemetry formatting
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OrderUpdateEvent>) {
          return formatOrderUpdate(e);
        } else if constexpr (std::is_same_v<T, PnlSnapshotEvent>) {
          return formatPnlSnapshot(e);
        } else {
          return formatStrategyState(e);
        }
      },
      event);
}

std::string IpcServer::formatOrderUpdate(const OrderUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "order_update";
  j["order_id"] = e.order.id;
  j["market_id"] = e.order.instrument.market_id;
  j["token_id"] = e.order.instrument.token_id;
  j["side"] = domain::toString(e.order.side);
  j["price"] = e.order.price;
  j["size"] = e.order.size;
  j["status"] = domain::toString(e.order.status);
  j["previous_status"] = domain::toString(e.previous_status);
  j["timestamp_ms"] = e.timestamp_ms;
  return j.dump();
}

std::string IpcServer::formatPnlSnapshot(const PnlSnapshotEvent& e) {
  nlohmann::json j;
  j["type"] = "pnl_snapshot";
  j["timestamp_ms"] = e.snapshot.timestamp_ms;
  j["realized_pnl"] = e.snapshot.realized_pnl;
  j["rewards"] = e.snapshot.rewards;
  j["total_pnl"] = e.snapshot.total_pnl;
  j["buy_volume"] = e.snapshot.buy_volume;
  j["sell_volume"] = e.snapshot.sell_volume;
  j["confirmed_trades"] = e.snapshot.confirmed_trades;
  j["history_size"] = e.history_size;
  return j.dump();
}

std::string IpcServer::formatStrategyState(const StrategyStateEvent& e) {
  nlohmann::json j;
  j["type"] = "strategy_state";
  j["market_id"] = e.instrument.market_id;
  j["token_id"] = e.instrument.token_id;
  j["state"] = domain::toString(e.state);
  j["previous_state"] = domain::toString(e.previous_state);
  j["timestamp_ms"] = e.timestamp_ms;
  return j.dump();
}

}  // namespace pmm
