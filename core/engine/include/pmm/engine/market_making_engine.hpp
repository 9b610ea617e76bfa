#pragma once

#include "pmm/config/engine_config.hpp"
#include "pmm/domain/instrument.hpp"
#include "pmm/domain/strategy_params.hpp"
#include "pmm/domain/strategy_state.hpp"
#include "pmm/eventbus/event_bus.hpp"
#include "pmm/exchange/i_exchange_client.hpp"
#include "pmm/exchange/i_rewards_source.hpp"
#include "pmm/network/ipc_server.hpp"
#include "pmm/orders/order_manager.hpp"
#include "pmm/pnl/pnl_tracker.hpp"
#include "pmm/pricing/quote_pricer.hpp"
#include "pmm/strategy/strategy_loop.hpp"
#include "pmm/time/i_time_provider.hpp"
#include "pmm/time/i_timer.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pmm {

// Outcome of one configured run, available after wait().
struct RunReport {
  RunConfig run;
  RunSummary summary;
};

// -----------------------------------------------------------------------------
// MarketMakingEngine - top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the shared components, runs one StrategyLoop per configured
//         instrument on its own thread, and answers operator commands.
//
// @details
// Component graph (all shared by every run):
//
//   IExchangeClient ──► QuotePricer ──┐
//        │                            ├──► StrategyLoop (one per run,
//        ├───────────► OrderManager ──┘     one thread, one ITimer)
//        └───────────► PnlTracker
//
//   EventBus ◄── OrderUpdateEvent / PnlSnapshotEvent / StrategyStateEvent
//        └──► IpcServer telemetry queue (when endpoints are configured)
//
// PnL snapshots:
//   After every pnl_snapshot_every_cycles completed cycles of a run
//   (0 disables), and once more after all runs have finished.
//
// Lifecycle:
//   start(runs)  Builds one StrategyLoop + timer per run and spawns the
//                threads. The IpcServer (if enabled) is started first so
//                STATUS works while runs are in progress.
//   stop()       Cancels every run's timer. Each loop winds down (cancels
//                its quotes) and returns. Safe from any thread, including
//                a signal-watching thread or the IPC thread (STOP command).
//   wait()       Joins the run threads, then takes the final snapshot.
//   ~Engine      stop() + wait(), then stops the IpcServer.
//
// Thread model:
//   start()/wait() from the owning thread. stop() and executeCommand() from
//   any thread. workers_mutex_ guards the worker list and summaries.
//
// Ownership:
//   Borrows the exchange client, rewards source and time provider; owns
//   everything else.
// -----------------------------------------------------------------------------
class MarketMakingEngine {
 public:
  using TimerFactory = std::function<std::unique_ptr<ITimer>()>;

  // timer_factory defaults to LiveTimer. Empty IPC endpoints disable the
  // IpcServer.
  MarketMakingEngine(IExchangeClient& client, IRewardsSource& rewards,
                     const ITimeProvider& time_provider,
                     domain::StrategyParams params = {},
                     IpcConfig ipc = IpcConfig{"", ""},
                     TimerFactory timer_factory = nullptr);

  ~MarketMakingEngine();

  MarketMakingEngine(const MarketMakingEngine&) = delete;
  MarketMakingEngine& operator=(const MarketMakingEngine&) = delete;
  MarketMakingEngine(MarketMakingEngine&&) = delete;
  MarketMakingEngine& operator=(MarketMakingEngine&&) = delete;

  // Spawns one strategy thread per run. A second call while runs are still
  // active is ignored and logged.
  void start(const std::vector<RunConfig>& runs);

  void stop();

  // Blocks until every run is Done. Returns the per-run reports.
  std::vector<RunReport> wait();

  bool stopRequested() const { return stop_requested_.load(); }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // PING    {"status":"ok","response":"PONG"}
  // STATUS  {"status":"ok","stop_requested":..,"runs":[{market_id,
  //          token_id, state, live_orders}], "pnl": {...} | null}
  // PNL     {"status":"ok","pnl":{...}} or status "error" if retrieval failed
  // STOP    {"status":"ok","response":"Stopping"}; same as stop()
  // other   {"status":"error","response":"Unknown command: <cmd>"}
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  OrderManager& orderManager() { return orders_; }
  PnlTracker& pnlTracker() { return pnl_; }
  const QuotePricer& quotePricer() const { return pricer_; }

 private:
  struct Worker {
    RunConfig run;
    std::unique_ptr<ITimer> timer;
    std::unique_ptr<StrategyLoop> loop;
    std::thread thread;
    RunSummary summary;
  };

  void runWorker(Worker& worker);
  void onCycle(std::uint64_t cycle);

  const ITimeProvider& time_provider_;
  const domain::StrategyParams params_;
  const IpcConfig ipc_config_;
  TimerFactory timer_factory_;

  EventBus bus_;
  QuotePricer pricer_;
  OrderManager orders_;
  PnlTracker pnl_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;

  mutable std::mutex workers_mutex_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> stop_requested_{false};
};

}  // namespace pmm
