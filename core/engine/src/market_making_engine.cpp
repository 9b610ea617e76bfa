#include "pmm/engine/market_making_engine.hpp"

#include "pmm/time/live_timer.hpp"
#include "pmm/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace pmm {

namespace {

nlohmann::json pnlToJson(const domain::PnlSnapshot& snap) {
  nlohmann::json j;
  j["timestamp_ms"] = snap.timestamp_ms;
  j["realized_pnl"] = snap.realized_pnl;
  j["rewards"] = snap.rewards;
  j["total_pnl"] = snap.total_pnl;
  j["buy_volume"] = snap.buy_volume;
  j["sell_volume"] = snap.sell_volume;
  j["confirmed_trades"] = snap.confirmed_trades;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MarketMakingEngine::MarketMakingEngine(IExchangeClient& client,
                                       IRewardsSource& rewards,
                                       const ITimeProvider& time_provider,
                                       domain::StrategyParams params,
                                       IpcConfig ipc,
                                       TimerFactory timer_factory)
    : time_provider_(time_provider),
      params_(params),
      ipc_config_(std::move(ipc)),
      timer_factory_(std::move(timer_factory)),
      pricer_(client),
      orders_(client, time_provider, &bus_),
      pnl_(client, rewards, time_provider, &bus_) {
  if (!timer_factory_) {
    timer_factory_ = [] { return std::make_unique<LiveTimer>(); };
  }
}

// -----------------------------------------------------------------------------
// Destructor: stop runs, join, then take down the IPC server
// -----------------------------------------------------------------------------
MarketMakingEngine::~MarketMakingEngine() {
  stop();
  wait();

  for (auto id : telemetry_subscriptions_) {
    bus_.unsubscribe(id);
  }
  ipc_server_.reset();
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void MarketMakingEngine::start(const std::vector<RunConfig>& runs) {
  std::lock_guard lock(workers_mutex_);
  if (!workers_.empty()) {
    std::cerr << "[MarketMakingEngine] start() ignored: runs already "
                 "started.\n";
    return;
  }

  // ---  1) IPC server first, so STATUS/STOP work for the whole session -----
  if (ipc_config_.enabled() && !ipc_server_) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_config_.command_endpoint, ipc_config_.telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscriptions_.push_back(bus_.subscribe<OrderUpdateEvent>(
        [this](const OrderUpdateEvent& e) { ipc_server_->pushTelemetry(e); }));
    telemetry_subscriptions_.push_back(bus_.subscribe<PnlSnapshotEvent>(
        [this](const PnlSnapshotEvent& e) { ipc_server_->pushTelemetry(e); }));
    telemetry_subscriptions_.push_back(bus_.subscribe<StrategyStateEvent>(
        [this](const StrategyStateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
  }

  // ---  2) One loop + timer per run -----------------------------------------
  for (const auto& run : runs) {
    auto worker = std::make_unique<Worker>();
    worker->run = run;
    worker->timer = timer_factory_();
    worker->loop = std::make_unique<StrategyLoop>(
        orders_, pricer_, time_provider_, *worker->timer, params_, &bus_);
    worker->loop->setCycleObserver(
        [this](const domain::Instrument&, std::uint64_t cycle) {
          onCycle(cycle);
        });
    if (stop_requested_.load()) {
      worker->loop->stop();
    }
    workers_.push_back(std::move(worker));
  }

  // ---  3) Spawn threads last --------------------------------------------
  for (auto& worker : workers_) {
    Worker* w = worker.get();
    w->thread = std::thread([this, w] { runWorker(*w); });
  }

  std::cout << "[MarketMakingEngine] started " << workers_.size()
            << " run(s).\n";
}

// -----------------------------------------------------------------------------
// stop(): cancel every run's timer
// -----------------------------------------------------------------------------
void MarketMakingEngine::stop() {
  if (stop_requested_.exchange(true)) {
    return;
  }

  std::lock_guard lock(workers_mutex_);
  for (auto& worker : workers_) {
    worker->loop->stop();
  }
  if (!workers_.empty()) {
    std::cout << "[MarketMakingEngine] stop requested. Winding down "
              << workers_.size() << " run(s).\n";
  }
}

// -----------------------------------------------------------------------------
// wait(): join without holding workers_mutex_ (STATUS may need it)
// -----------------------------------------------------------------------------
std::vector<RunReport> MarketMakingEngine::wait() {
  std::vector<Worker*> pending;
  {
    std::lock_guard lock(workers_mutex_);
    for (auto& worker : workers_) {
      if (worker->thread.joinable()) {
        pending.push_back(worker.get());
      }
    }
  }

  for (Worker* worker : pending) {
    worker->thread.join();
  }

  if (!pending.empty()) {
    if (auto snap = pnl_.snapshot()) {
      std::cout << "[MarketMakingEngine] Final P&L: " << snap->total_pnl
                << " (realized " << snap->realized_pnl << ", rewards "
                << snap->rewards << ") at "
                << format_iso8601(snap->timestamp_ms) << "\n";
    }
  }

  std::vector<RunReport> reports;
  std::lock_guard lock(workers_mutex_);
  for (const auto& worker : workers_) {
    reports.push_back(RunReport{worker->run, worker->summary});
  }
  return reports;
}

// -----------------------------------------------------------------------------
// runWorker(): strategy thread body
// -----------------------------------------------------------------------------
void MarketMakingEngine::runWorker(Worker& worker) {
  const RunConfig& run = worker.run;
  RunSummary summary =
      worker.loop->run(run.instrument, run.risk_amount, run.max_spread,
                       minutes_to_ms(run.duration_minutes));

  std::lock_guard lock(workers_mutex_);
  worker.summary = summary;
}

void MarketMakingEngine::onCycle(std::uint64_t cycle) {
  const std::uint64_t every = params_.pnl_snapshot_every_cycles;
  if (every == 0 || cycle % every != 0) {
    return;
  }
  if (auto snap = pnl_.snapshot()) {
    std::cout << "[MarketMakingEngine] Current P&L: " << snap->total_pnl
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string MarketMakingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["stop_requested"] = stop_requested_.load();

    nlohmann::json runs_json = nlohmann::json::array();
    {
      std::lock_guard lock(workers_mutex_);
      for (const auto& worker : workers_) {
        nlohmann::json r;
        r["market_id"] = worker->run.instrument.market_id;
        r["token_id"] = worker->run.instrument.token_id;
        r["state"] = domain::toString(worker->loop->state());
        r["live_orders"] = orders_.liveCount(worker->run.instrument);
        runs_json.push_back(std::move(r));
      }
    }
    response["runs"] = std::move(runs_json);

    auto latest = pnl_.latest();
    response["pnl"] = latest ? pnlToJson(*latest) : nlohmann::json(nullptr);
  } else if (cmd == "PNL") {
    auto snap = pnl_.snapshot();
    if (snap) {
      response["status"] = "ok";
      response["pnl"] = pnlToJson(*snap);
    } else {
      response["status"] = "error";
      response["response"] = "P&L retrieval failed";
    }
  } else if (cmd == "STOP") {
    stop();
    response["status"] = "ok";
    response["response"] = "Stopping";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace pmm
