#include "pmarb/alerter.hpp"
#include "pmarb/atomic_executor.hpp"
#include "pmarb/common.hpp"
#include "pmarb/config.hpp"
#include "pmarb/cost_model.hpp"
#include "pmarb/engine.hpp"
#include "pmarb/gas_oracle.hpp"
#include "pmarb/ledger.hpp"
#include "pmarb/logger.hpp"
#include "pmarb/paper_venue.hpp"
#include "pmarb/snapshot_feed.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace pmarb;

static volatile std::sig_atomic_t running = 1;

static void signalHandler(int) { running = 0; }

static void usage() {
  std::cout << R"(
╔═══════════════════════════════════════════════════════════╗
║      PMARB — Prediction-Market Arbitrage Engine           ║
║   Cost model · Capital ledger · Two-leg atomic executor   ║
╚═══════════════════════════════════════════════════════════╝

Usage: pmarb --snapshot <FILE> [OPTIONS]

Options:
  --config <FILE>         JSON config (see config.example.json)
  --snapshot <FILE>       Market snapshot JSON, re-read every cycle
  --state <FILE>          Ledger state file (loaded at start, saved at exit)
  --cycles <N>            Stop after N cycles (default: run until signalled)
  --scan-interval <SEC>   Seconds between cycles (default: 1)
  --max-trade <USD>       Position size per opportunity (default: 100)
  --min-margin <PCT>      Minimum net profit margin % (default: 2.5)
  --policy <NAME>         Unhedged policy: alert | unwind | unwind_and_alert
  --log-dir <DIR>         CSV journal directory (default: logs)
  --paper                 Paper trading mode (default)
  --live                  Live mode (requires live venue adapters)
  --verbose               Debug logging
  --help, -h              Show this help

Environment:
  POLYGON_RPC_URL         JSON-RPC endpoint for live gas prices
  TELEGRAM_BOT_TOKEN      Telegram bot token for unhedged alerts
  TELEGRAM_CHAT_ID        Telegram chat id for unhedged alerts
)";
}

// ── Parse CLI args ──────────────────────────────────────────────────
static Config parseArgs(int argc, char *argv[], bool &verbose) {
  Config cfg;

  // Config file first so that flags override it
  for (int i = 1; i + 1 < argc; i++) {
    if (std::string(argv[i]) == "--config")
      cfg = loadConfigFile(argv[i + 1], cfg);
  }
  applyEnv(cfg);

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc)
      ++i;
    else if (arg == "--live")
      cfg.live_mode = true;
    else if (arg == "--paper")
      cfg.live_mode = false;
    else if (arg == "--snapshot" && i + 1 < argc)
      cfg.snapshot_path = argv[++i];
    else if (arg == "--state" && i + 1 < argc)
      cfg.state_path = argv[++i];
    else if (arg == "--cycles" && i + 1 < argc)
      cfg.max_cycles = std::stoi(argv[++i]);
    else if (arg == "--scan-interval" && i + 1 < argc)
      cfg.scan_interval_s = std::stoi(argv[++i]);
    else if (arg == "--max-trade" && i + 1 < argc)
      cfg.strategy.position_size_usd = std::stod(argv[++i]);
    else if (arg == "--min-margin" && i + 1 < argc)
      cfg.strategy.min_profit_margin_pct = std::stod(argv[++i]);
    else if (arg == "--policy" && i + 1 < argc) {
      std::string name = argv[++i];
      auto policy = parsePolicy(name);
      if (!policy)
        throw ConfigError("unknown unhedged policy: " + name);
      cfg.exec.unhedged_policy = *policy;
    } else if (arg == "--log-dir" && i + 1 < argc)
      cfg.log_dir = argv[++i];
    else if (arg == "--verbose")
      verbose = true;
    else if (arg == "--help" || arg == "-h") {
      usage();
      std::exit(0);
    } else {
      throw ConfigError("unknown argument: " + arg);
    }
  }
  return cfg;
}

// ── Main pipeline ────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Setup logging
  auto console = spdlog::stdout_color_mt("pmarb");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  Config cfg;
  bool verbose = false;
  try {
    cfg = parseArgs(argc, argv, verbose);
    validateConfig(cfg);
  } catch (const std::exception &e) {
    // std::stoi/stod failures land here too
    spdlog::error("Configuration error: {}", e.what());
    return 2;
  }
  if (verbose)
    spdlog::set_level(spdlog::level::debug);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  // Banner
  spdlog::info("╔═══════════════════════════════════════════════════════╗");
  spdlog::info("║      PMARB — Prediction-Market Arbitrage Engine       ║");
  spdlog::info("╚═══════════════════════════════════════════════════════╝");
  spdlog::info("Mode: {}", cfg.live_mode ? "🔴 LIVE" : "📝 PAPER");
  spdlog::info("Capital: ${:.2f}", cfg.risk.total_capital_usd);
  spdlog::info("Position size: ${:.2f}", cfg.strategy.position_size_usd);
  spdlog::info("Min margin: {:.2f}%", cfg.strategy.min_profit_margin_pct);
  spdlog::info("Unhedged policy: {}", policyName(cfg.exec.unhedged_policy));
  spdlog::info("Gas RPC: {}", cfg.cost.gas_rpc_url.empty() ? "❌ default price"
                                                            : "✅");
  spdlog::info("Telegram: {}", cfg.alert.telegram_bot_token.empty() ? "❌" : "✅");

  if (cfg.live_mode) {
    spdlog::error("No live venue adapters are configured in this build; run "
                  "with --paper.");
    return 1;
  }
  if (cfg.snapshot_path.empty()) {
    spdlog::error("--snapshot is required.");
    return 1;
  }

  try {
    // ── Initialize components ──────────────────────────────────────
    std::unique_ptr<RpcGasOracle> oracle;
    if (!cfg.cost.gas_rpc_url.empty())
      oracle = std::make_unique<RpcGasOracle>(cfg.cost.gas_rpc_url);

    std::unique_ptr<Alerter> alerter;
    if (!cfg.alert.telegram_bot_token.empty() &&
        !cfg.alert.telegram_chat_id.empty())
      alerter = std::make_unique<TelegramAlerter>(cfg.alert.telegram_bot_token,
                                                  cfg.alert.telegram_chat_id);
    else
      alerter = std::make_unique<LogAlerter>();

    CostModel costs(cfg.cost, oracle.get());
    CapitalLedger ledger(cfg.risk);
    if (!cfg.state_path.empty() && std::filesystem::exists(cfg.state_path))
      ledger.loadState(cfg.state_path);

    PaperVenueAdapter poly(Venue::POLYMARKET);
    PaperVenueAdapter kalshi(Venue::KALSHI);
    PaperVenueAdapter pnp(Venue::PNP);
    VenueRouter router;
    router.add(Venue::POLYMARKET, poly);
    router.add(Venue::KALSHI, kalshi);
    router.add(Venue::PNP, pnp);

    AtomicExecutor executor(cfg.exec, router, alerter.get());
    SnapshotFeed feed(cfg.snapshot_path);
    Logger journal(cfg.log_dir);
    ArbitrageEngine engine(cfg, costs, ledger, executor, feed, &journal);

    // ── Main loop ──────────────────────────────────────────────────
    int cycle = 0;
    while (running && (cfg.max_cycles == 0 || cycle < cfg.max_cycles)) {
      cycle++;
      auto cycle_start = std::chrono::steady_clock::now();

      try {
        if (cycle > 1)
          feed.reload();

        auto quotes = feed.quotes();
        std::vector<RelationshipSignal> signals;
        for (const auto &p : feed.pairs())
          signals.push_back(feed.classify(p.first, p.second));

        auto ranked = engine.scan(quotes, signals);
        auto results = engine.executeBatch(ranked);

        journal.logCycle(cycle, static_cast<int>(quotes.size()),
                         static_cast<int>(ranked.size()),
                         static_cast<int>(results.size()),
                         elapsed_ms(cycle_start));
      } catch (const std::exception &e) {
        spdlog::error("Cycle {} error: {}", cycle, e.what());
      }

      if (running && (cfg.max_cycles == 0 || cycle < cfg.max_cycles))
        std::this_thread::sleep_for(std::chrono::seconds(cfg.scan_interval_s));
    }

    // ── Summary ────────────────────────────────────────────────────
    auto exp = engine.exposure();
    auto pnl = engine.pnlSummary();
    spdlog::info("Exposure: ${:.2f} open, ${:.2f} reserved, diversification "
                 "{:.3f}",
                 exp.total_exposure_usd, exp.reserved_usd,
                 exp.diversification_score);
    spdlog::info("Realized PnL: ${:.2f} over {} closed trades ({:.1f}% win)",
                 pnl.total_pnl_usd, pnl.total_trades, pnl.win_rate_pct);

    if (!cfg.state_path.empty())
      ledger.saveState(cfg.state_path);

    spdlog::info("Shutting down gracefully after {} cycles.", cycle);
  } catch (const std::exception &e) {
    spdlog::critical("Fatal: {}", e.what());
    return 1;
  }
  return 0;
}
