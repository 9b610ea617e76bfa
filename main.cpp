// -----------------------------------------------------------------------------
// pmm_engine - single executable entry point.
//
// Paper-trading session:
//   1) Load the JSON configuration (argv[1], default config/pmm.json).
//   2) Build a PaperExchange on the wall clock and seed it with the
//      configured markets and third-party book.
//   3) Log the active markets from the catalog.
//   4) Start one StrategyLoop per configured run inside the
//      MarketMakingEngine, with the IpcServer serving STATUS/PNL/STOP.
//   5) Wait for every run to finish (duration elapsed, STOP command, or
//      Ctrl-C), then log the final P&L and per-run summaries.
//
// Thread layout:
//   main thread        → engine.wait()
//   stop watcher       → turns SIGINT into engine.stop()
//   one thread per run → StrategyLoop::run()
//   IPC thread         → IpcServer (commands + telemetry)
// -----------------------------------------------------------------------------

#include "pmm/config/engine_config.hpp"
#include "pmm/domain/instrument.hpp"
#include "pmm/engine/market_making_engine.hpp"
#include "pmm/exchange/i_rewards_source.hpp"
#include "pmm/exchange/paper_exchange.hpp"
#include "pmm/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// SIGINT flag. The handler only stores to a lock-free atomic; the stop
// watcher thread polls it and calls engine.stop() outside signal context.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_sigint{false};

static void sigint_handler(int /*signum*/) { g_sigint.store(true); }

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/pmm.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. Errors here are fatal.
  // -------------------------------------------------------------------------
  pmm::EngineConfig config;
  try {
    config = pmm::loadEngineConfig(config_path);
  } catch (const pmm::ConfigError& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }
  std::cout << "[main] Loaded " << config.runs.size() << " run(s) from "
            << config_path << "\n";

  // -------------------------------------------------------------------------
  // 2) Paper exchange.
  // -------------------------------------------------------------------------
  pmm::LiveTimeProvider clock;
  pmm::PaperExchange exchange(clock, config.paper.account_address,
                              config.paper.min_order_size);
  for (const auto& market : config.paper.markets) {
    exchange.addMarket(market);
  }
  for (const auto& seed : config.paper.book) {
    exchange.seedOrder(seed.instrument, seed.side, seed.price, seed.size);
  }
  pmm::ConstantRewardsSource rewards(config.paper.rewards_total);

  // -------------------------------------------------------------------------
  // 3) Catalog.
  // -------------------------------------------------------------------------
  try {
    auto markets = exchange.activeMarkets();
    std::cout << "[main] Found " << markets.size() << " active markets\n";
    for (const auto& market : markets) {
      std::cout << "[main]   " << pmm::domain::describeMarket(market) << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Error getting active markets: " << e.what() << "\n";
  }

  // -------------------------------------------------------------------------
  // 4) Engine + SIGINT watcher.
  // -------------------------------------------------------------------------
  int exit_code = 0;
  try {
    pmm::MarketMakingEngine engine(exchange, rewards, clock, config.strategy,
                                   config.ipc);

    std::signal(SIGINT, sigint_handler);
    engine.start(config.runs);

    std::atomic<bool> done{false};
    std::thread watcher([&engine, &done] {
      while (!done.load()) {
        if (g_sigint.load()) {
          std::cout << "\n[main] SIGINT received. Shutting down...\n";
          engine.stop();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    // -----------------------------------------------------------------------
    // 5) Wait for every run and report.
    // -----------------------------------------------------------------------
    auto reports = engine.wait();
    done.store(true);
    watcher.join();

    for (const auto& report : reports) {
      const auto& s = report.summary;
      std::cout << "[main] " << report.run.instrument << ": " << s.cycles
                << " cycles, " << s.failed_cycles << " failed, " << s.placed
                << " placed, " << s.cancel_confirmed << " canceled, "
                << s.left_resting << " left resting"
                << (s.stopped_early ? " (stopped early)" : "") << "\n";
      if (s.left_resting > 0) {
        exit_code = 2;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, SIG_DFL);
  return exit_code;
}
